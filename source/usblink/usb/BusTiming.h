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

#include <cstddef>

namespace usblink::usb
{
	/// Interpacket delays of one bus speed in clock cycles.
	struct TurnaroundTiming
	{
		/// earliest cycle after the end of a received packet at which a response may start
		size_t rxToTxMin = 0;
		/// latest cycle after the end of a received packet at which a response must have started
		size_t rxToTxMax = 0;
		/// cycles after the end of a transmitted packet without response after which the host gave up
		size_t txToRxTimeout = 0;
	};

	/**
	 * @brief All protocol time constants converted to cycles of the link layer clock.
	 * @details Minimum delays are rounded up and maximum delays are rounded down.
	 */
	struct BusTiming
	{
		sim::ClockRational clockFrequency = 60'000'000ull;

		TurnaroundTiming high;
		TurnaroundTiming full;
		TurnaroundTiming low;

		/// SE0 duration that constitutes a bus reset (2.5 us)
		size_t resetDetect = 0;
		/// idle duration after which the bus is suspended (3 ms)
		size_t suspendDetect = 0;
		/// duration of the device Chirp-K (2 ms)
		size_t deviceChirp = 0;
		/// minimal duration of a host chirp K or J (2.5 us)
		size_t chirpFilter = 0;
		/// time to wait for the next host chirp before falling back to full speed (1 ms)
		size_t hostChirpTimeout = 0;
		/// settle time before sampling the line when leaving high speed (200 us)
		size_t hsSuspendSettle = 0;

		static BusTiming forClock(sim::ClockRational frequency);

		const TurnaroundTiming &turnaround(UsbSpeed speed) const;
		/// Largest threshold of all turnaround timings.
		size_t longestTurnaround() const;
	};
}
