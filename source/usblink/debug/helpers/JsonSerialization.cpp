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
#include "JsonSerialization.h"

#include "../DebugInterface.h"

#include <magic_enum.hpp>
#include <boost/format.hpp>

#include <sstream>

namespace usblink::dbg::json {

void serializeString(std::ostream &json, std::string_view str)
{
	json << '"';
	for (char c : str) {
		switch (c) {
			case '"': json << "\\\""; break;
			case '\\': json << "\\\\"; break;
			case '\n': json << "\\n"; break;
			default: json << c;
		}
	}
	json << '"';
}

void serializeLogMessage(std::ostream &json, const LogMessage &msg)
{
	json
		<< "{ \"severity\": \"" << magic_enum::enum_name(msg.severity()) << "\",\n"
		<< "\"source\": \"" << magic_enum::enum_name(msg.source()) << "\",\n"
		<< "\"cycle\": " << msg.cycle() << ",\n"
		<< "\"message_parts\": [\n";

	bool firstPart = true;
	for (const auto &part : msg.parts()) {
		if (!firstPart) json << ",\n";
		firstPart = false;

		if (std::holds_alternative<const char*>(part)) {
			json << "{\"type\": \"string\", \"data\": ";
			serializeString(json, std::get<const char*>(part));
			json << "}\n";
		} else if (std::holds_alternative<std::string>(part)) {
			json << "{\"type\": \"string\", \"data\": ";
			serializeString(json, std::get<std::string>(part));
			json << "}\n";
		} else if (std::holds_alternative<LogMessage::Packet>(part)) {
			json << "{\"type\": \"packet\", \"bytes\": [";
			bool firstByte = true;
			for (std::uint8_t byte : std::get<LogMessage::Packet>(part).bytes) {
				if (!firstByte) json << ", ";
				firstByte = false;
				json << (boost::format("\"%02X\"") % unsigned(byte));
			}
			json << "]}\n";
		}
	}

	json << "]}";
}

std::string serializeLogMessage(const LogMessage &msg)
{
	std::stringstream json;
	serializeLogMessage(json, msg);
	return json.str();
}

}
