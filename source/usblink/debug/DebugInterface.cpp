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
#include "DebugInterface.h"
#include "reporting/ReportInterface.h"

#include <boost/format.hpp>

namespace usblink::dbg {

LogMessage::LogMessage()
{
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string LogMessage::text() const
{
	std::string result;
	for (const auto &part : m_messageParts) {
		if (std::holds_alternative<const char*>(part))
			result += std::get<const char*>(part);
		else if (std::holds_alternative<std::string>(part))
			result += std::get<std::string>(part);
		else {
			bool first = true;
			for (std::uint8_t byte : std::get<Packet>(part).bytes) {
				if (!first) result += ' ';
				first = false;
				result += (boost::format("%02X") % unsigned(byte)).str();
			}
		}
	}
	return result;
}


thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

void logReport(const std::filesystem::path &outputDir)
{
	ReportInterface::create(outputDir);
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
