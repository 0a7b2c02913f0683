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

#include "Utmi.h"
#include "../simulation/ClockRational.h"

namespace usblink::utils { class ConfigTree; }

namespace usblink::usb
{
	/// Construction parameters of a device.
	struct DeviceConfig
	{
		/// frequency of the UTMI clock, 60 MHz for UTMI+ low pin interface PHYs
		sim::ClockRational clockFrequency = 60'000'000ull;
		/// high enables the chirp handshake, low turns the device into a low speed device
		UsbSpeed maxSpeed = UsbSpeed::high;
		/// Only report tokens sent to the current device address.
		bool filterByAddress = true;

		/**
		 * @brief Overrides the fields present in the given tree.
		 * @details Keys are clock_frequency (Hz), max_speed (high, full or low) and
		 * filter_by_address.
		 */
		void load(const utils::ConfigTree &config);

		/// Throws a DesignError if the combination of settings cannot work.
		void validate() const;
	};
}
