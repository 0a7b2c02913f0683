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
#include <optional>

namespace usblink::usb
{
	enum class EndpointDirection : uint8_t
	{
		out = 0,
		in = 1,
	};

	/// Which slots of the endpoint address space a handler occupies.
	struct EndpointAddress
	{
		uint8_t number = 0;
		/// nullopt for control endpoints occupying both directions
		std::optional<EndpointDirection> direction;

		bool overlaps(const EndpointAddress &other) const
		{
			return number == other.number && (!direction || !other.direction || *direction == *other.direction);
		}

		/// bEndpointAddress as used in endpoint descriptors
		uint8_t encode() const
		{
			return uint8_t(number | (direction == EndpointDirection::in ? 0x80 : 0x00));
		}
	};
}
