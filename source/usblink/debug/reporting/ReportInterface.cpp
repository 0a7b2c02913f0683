/*  This file is part of UsbLink, a cycle accurate USB 2.0 device link layer.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	UsbLink is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	UsbLink is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "usblink/pch.h"
#include "ReportInterface.h"

#include "../helpers/JsonSerialization.h"

using namespace std::literals;

namespace usblink::dbg {

	void ReportInterface::create(const std::filesystem::path &outputDir)
	{
		instance.reset(nullptr); // Close previous first
		instance.reset(new ReportInterface(outputDir));
	}

	ReportInterface::ReportInterface(const std::filesystem::path &outputDir) : m_outputDir(outputDir)
	{
		auto dataFolder = outputDir / "data";
		if (!std::filesystem::exists(dataFolder))
			std::filesystem::create_directories(dataFolder);

		m_logMessages.open(dataFolder / "report.js", "logMessages"sv);
	}

	std::string ReportInterface::howToReachLog()
	{
		return std::string("Log messages are written to ") + std::filesystem::absolute(m_outputDir / "data" / "report.js").string();
	}

	void ReportInterface::log(LogMessage msg)
	{
		json::serializeLogMessage(m_logMessages.append().newEntity(), msg);
	}

}
