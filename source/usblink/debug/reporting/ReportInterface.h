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
#pragma once

#include "../DebugInterface.h"
#include "../helpers/IncrementalJson.h"

#include <filesystem>

/**
 * @addtogroup usblink_logging
 * @{
 */

namespace usblink::dbg {
	/// Writes all log messages as json into `<outputDir>/data/report.js`.
	class ReportInterface : public DebugInterface
	{
		public:
			static void create(const std::filesystem::path &outputDir);

			ReportInterface(const std::filesystem::path &outputDir);

			virtual void log(LogMessage msg) override;

			virtual std::string howToReachLog() override;
		protected:
			std::filesystem::path m_outputDir;

			json::IncrementalArray m_logMessages;
	};
}

/**@}*/
