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
#include "DeviceConfig.h"

#include "../utils/ConfigTree.h"
#include "../utils/Exceptions.h"

namespace usblink::usb
{
	void DeviceConfig::load(const utils::ConfigTree &config)
	{
		if (auto frequency = config["clock_frequency"])
			clockFrequency = sim::ClockRational(frequency.as<uint64_t>(sim::floor(clockFrequency)));
		maxSpeed = config["max_speed"].as(maxSpeed);
		filterByAddress = config["filter_by_address"].as(filterByAddress);
	}

	void DeviceConfig::validate() const
	{
		USBLINK_DESIGNCHECK_HINT(clockFrequency > sim::ClockRational(0ull), "the device needs a clock");
		USBLINK_DESIGNCHECK_HINT(maxSpeed != UsbSpeed::high || clockFrequency >= sim::ClockRational(60'000'000ull),
			"a high speed capable device needs at least a 60 MHz clock to keep up with the byte rate");
	}
}
