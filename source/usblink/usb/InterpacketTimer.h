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

#include "BusTiming.h"
#include "../simulation/Reg.h"

#include <cstddef>

namespace usblink::usb
{
	/// Connection of one consumer to the shared interpacket timer.
	struct InterpacketTimerInterface
	{
		/// request to restart the count, driven by the consumer
		bool start = false;

		bool txAllowed = false;
		bool txTimeout = false;
		bool rxTimeout = false;
	};

	/// Identifies the consumer requesting a restart of the timer.
	enum class TimerRequester
	{
		tokenDetector,
		dataReceiver,
		dataGenerator,
		endpoints,
	};

	/**
	 * @brief Counts clock cycles since the last packet boundary.
	 * @details All pulses are derived combinationally from the counter, they are valid in the
	 * cycle the counter reaches the threshold of the current bus speed. The counter starts
	 * saturated such that no pulse fires before the first start.
	 */
	class InterpacketTimer
	{
	public:
		InterpacketTimer(const BusTiming &timing);

		InterpacketTimerInterface outputs(UsbSpeed speed) const;
		/// Copies the pulses into a consumer's interface and clears its start request.
		void connect(InterpacketTimerInterface &consumer, UsbSpeed speed) const;

		void start(TimerRequester requester);
		void evaluate();
		void commit();
		void reset();

		size_t counter() const { return m_counter.current(); }
	protected:
		const BusTiming &m_timing;
		size_t m_saturation;
		sim::Reg<size_t> m_counter;

		bool m_started = false;
		TimerRequester m_startedBy = TimerRequester::tokenDetector;
	};
}
