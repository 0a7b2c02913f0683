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

#include <array>
#include <cstdint>
#include <span>

namespace usblink::usb
{
	enum class SetupRequest : uint8_t
	{
		GET_STATUS = 0,
		CLEAR_FEATURE = 1,
		SET_FEATURE = 3,
		SET_ADDRESS = 5,
		GET_DESCRIPTOR = 6,
		SET_DESCRIPTOR = 7,
		GET_CONFIGURATION = 8,
		SET_CONFIGURATION = 9,
		GET_INTERFACE = 10,
		SET_INTERFACE = 11,
		SYNCH_FRAME = 12,
	};

	enum class SetupType : uint8_t
	{
		standard = 0,
		classRequest = 1,
		vendor = 2,
		reserved = 3,
	};

	enum class SetupRecipient : uint8_t
	{
		device = 0,
		interface = 1,
		endpoint = 2,
		other = 3,
	};

	/// The 8 byte payload of a SETUP transaction.
	struct SetupPacket
	{
		uint8_t requestType = 0;
		uint8_t request = 0;
		uint16_t value = 0;
		uint16_t index = 0;
		uint16_t length = 0;

		/// Data stage flows from device to host.
		bool isIn() const { return requestType & 0x80; }
		SetupType type() const { return SetupType((requestType >> 5) & 3); }
		SetupRecipient recipient() const { return SetupRecipient(requestType & 0x1F); }
		bool isStandard() const { return type() == SetupType::standard; }
		bool is(SetupRequest req) const { return isStandard() && request == uint8_t(req); }

		uint8_t valueLow() const { return uint8_t(value); }
		uint8_t valueHigh() const { return uint8_t(value >> 8); }

		static SetupPacket decode(std::span<const uint8_t, 8> data)
		{
			return SetupPacket{
				.requestType = data[0],
				.request = data[1],
				.value = uint16_t(data[2] | data[3] << 8),
				.index = uint16_t(data[4] | data[5] << 8),
				.length = uint16_t(data[6] | data[7] << 8),
			};
		}

		std::array<uint8_t, 8> encode() const
		{
			return {
				requestType, request,
				uint8_t(value), uint8_t(value >> 8),
				uint8_t(index), uint8_t(index >> 8),
				uint8_t(length), uint8_t(length >> 8),
			};
		}

		bool operator == (const SetupPacket &) const = default;
	};
}
