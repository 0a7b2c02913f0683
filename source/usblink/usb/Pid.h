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

namespace usblink::usb
{
	/// 4 bit packet identifiers as they appear in the low nibble of the PID byte.
	enum class Pid : uint8_t
	{
		out		= 0b0001,
		in		= 0b1001,
		sof		= 0b0101,
		setup	= 0b1101,

		data0	= 0b0011,
		data1	= 0b1011,
		data2	= 0b0111,
		mdata	= 0b1111,

		ack		= 0b0010,
		nak		= 0b1010,
		stall	= 0b1110,
		nyet	= 0b0110,

		pre		= 0b1100,
		split	= 0b1000,
		ping	= 0b0100,
	};

	/// PID byte including the complemented check nibble.
	constexpr uint8_t pidByte(Pid pid) { return uint8_t(pid) | uint8_t(~uint8_t(pid) << 4); }

	constexpr bool pidCheckValid(uint8_t byte) { return (byte & 0xF) == (~byte >> 4 & 0xF); }

	constexpr bool isTokenPid(uint8_t pid) { return (pid & 0b11) == 0b01 || pid == uint8_t(Pid::ping); }
	constexpr bool isDataPid(uint8_t pid) { return (pid & 0b11) == 0b11; }
	constexpr bool isHandshakePid(uint8_t pid) { return (pid & 0b11) == 0b10; }

	/// Maps DATA0, DATA1, DATA2 and MDATA to the toggle selectors 0 to 3.
	constexpr uint8_t dataPidSelector(uint8_t pid)
	{
		// DATA0 = 0b0011, DATA1 = 0b1011, DATA2 = 0b0111, MDATA = 0b1111
		return uint8_t(((pid >> 3) & 1) | ((pid >> 1) & 2));
	}

	constexpr Pid dataPidFromSelector(uint8_t selector)
	{
		return Pid(0b0011 | ((selector & 1) << 3) | ((selector & 2) << 1));
	}
}
