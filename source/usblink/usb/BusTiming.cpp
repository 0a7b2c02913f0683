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
#include "BusTiming.h"

#include "../utils/Exceptions.h"

#include <algorithm>

namespace usblink::usb
{
	namespace
	{
		using sim::ClockRational;

		TurnaroundTiming turnaroundForBitRate(ClockRational frequency, ClockRational bitRate,
			ClockRational minBits, ClockRational maxBits, ClockRational timeoutBits)
		{
			TurnaroundTiming timing{
				.rxToTxMin = sim::ceil(minBits * frequency / bitRate),
				.rxToTxMax = sim::floor(maxBits * frequency / bitRate),
				.txToRxTimeout = sim::floor(timeoutBits * frequency / bitRate),
			};
			// a response can never start in the same cycle the packet ended
			timing.rxToTxMin = std::max<size_t>(timing.rxToTxMin, 1);
			return timing;
		}

		size_t cyclesFor(ClockRational frequency, ClockRational seconds)
		{
			return std::max<size_t>(sim::ceil(seconds * frequency), 1);
		}
	}

	BusTiming BusTiming::forClock(sim::ClockRational frequency)
	{
		USBLINK_DESIGNCHECK_HINT(frequency.numerator() != 0, "the link layer clock frequency must not be zero");

		BusTiming timing;
		timing.clockFrequency = frequency;

		timing.high = turnaroundForBitRate(frequency, 480'000'000ull, 8ull, 192ull, 816ull);
		timing.full = turnaroundForBitRate(frequency, 12'000'000ull, 2ull, ClockRational(13ull, 2ull), 18ull);
		timing.low = turnaroundForBitRate(frequency, 1'500'000ull, 2ull, ClockRational(13ull, 2ull), 18ull);

		timing.resetDetect = cyclesFor(frequency, ClockRational(25ull, 10'000'000ull));
		timing.suspendDetect = cyclesFor(frequency, ClockRational(3ull, 1'000ull));
		timing.deviceChirp = cyclesFor(frequency, ClockRational(2ull, 1'000ull));
		timing.chirpFilter = cyclesFor(frequency, ClockRational(25ull, 10'000'000ull));
		timing.hostChirpTimeout = cyclesFor(frequency, ClockRational(1ull, 1'000ull));
		timing.hsSuspendSettle = cyclesFor(frequency, ClockRational(200ull, 1'000'000ull));
		return timing;
	}

	const TurnaroundTiming &BusTiming::turnaround(UsbSpeed speed) const
	{
		switch (speed)
		{
			case UsbSpeed::high: return high;
			case UsbSpeed::full: return full;
			case UsbSpeed::low: return low;
		}
		USBLINK_ASSERT_HINT(false, "invalid bus speed");
	}

	size_t BusTiming::longestTurnaround() const
	{
		size_t longest = 0;
		for (const TurnaroundTiming *t : { &high, &full, &low })
			longest = std::max({ longest, t->rxToTxMin, t->rxToTxMax, t->txToRxTimeout });
		return longest;
	}
}
