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
	/// Bytes received from the host. `next` strobes once per byte while `valid` spans the packet.
	struct UsbOutStream
	{
		bool valid = false;
		bool next = false;
		uint8_t payload = 0;
	};

	/// Byte stream with ready/valid handshake and packet framing.
	struct ByteStream
	{
		bool valid = false;
		bool ready = false;
		bool first = false;
		bool last = false;
		uint8_t payload = 0;

		bool transfer() const { return valid && ready; }
	};
}
