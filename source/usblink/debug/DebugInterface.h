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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @addtogroup usblink_logging
 * @{
 */

namespace usblink::dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Aside from text, message parts can be raw packet bytes such that the logging backend
 * can render them in whatever way is suitable.
 *
 * A common use case is `log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_DEVICE << LogMessage::Cycle{now} << "address set to " << address);`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_DEVICE,
			LOG_PACKET,
			LOG_RESET,
			LOG_CONTROL,
			LOG_ENDPOINT,
			LOG_SIMULATION,
			LOG_CONFIGURATION
		};

		/// Clock cycle at which the logged event happened.
		struct Cycle {
			std::uint64_t value;
		};

		/// Raw bytes of a packet as they appeared on the UTMI bus.
		struct Packet {
			std::vector<std::uint8_t> bytes;
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }
		/// Stamps the message with a simulation cycle.
		LogMessage &operator<<(Cycle c) { m_cycle = c.value; return *this; }

		/// Adds a string message part
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// Adds the bytes of a packet, rendered as hex by the backends.
		LogMessage &operator<<(Packet p) { m_messageParts.push_back(std::move(p)); return *this; }

		/// Adds an integer number to the message
		LogMessage &operator<<(std::uint64_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }
		LogMessage &operator<<(std::uint32_t v) { return *this << std::uint64_t(v); }
		LogMessage &operator<<(std::uint16_t v) { return *this << std::uint64_t(v); }
		LogMessage &operator<<(std::uint8_t v) { return *this << std::uint64_t(v); }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }
		std::uint64_t cycle() const { return m_cycle; }

		/// @brief Returns the parts of which this message is composed.
		const auto &parts() const { return m_messageParts; }
		/// Concatenates all text parts (packets as hex) into one line.
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_DEVICE;
		std::uint64_t m_cycle = ~0ull;

		std::vector<std::variant<const char*, std::string, Packet>> m_messageParts;
};

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. usblink::dbg::logReport."; }
};

/// Initialize logging to write a json based static log into the given directory
void logReport(const std::filesystem::path &outputDir);

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

/**@}*/
