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
#include "InterpacketTimer.h"

#include "../utils/Exceptions.h"

#include <magic_enum.hpp>

namespace usblink::usb
{
	InterpacketTimer::InterpacketTimer(const BusTiming &timing) :
		m_timing(timing),
		m_saturation(timing.longestTurnaround() + 1),
		m_counter(m_saturation)
	{
	}

	InterpacketTimerInterface InterpacketTimer::outputs(UsbSpeed speed) const
	{
		const TurnaroundTiming &t = m_timing.turnaround(speed);
		size_t count = m_counter.current();

		return InterpacketTimerInterface{
			.start = false,
			.txAllowed = count == t.rxToTxMin,
			.txTimeout = count == t.rxToTxMax,
			.rxTimeout = count == t.txToRxTimeout,
		};
	}

	void InterpacketTimer::connect(InterpacketTimerInterface &consumer, UsbSpeed speed) const
	{
		consumer = outputs(speed);
	}

	void InterpacketTimer::start(TimerRequester requester)
	{
#ifndef NDEBUG
		USBLINK_ASSERT_HINT(!m_started || m_startedBy == requester,
			std::string("interpacket timer started by ") + std::string(magic_enum::enum_name(m_startedBy)) +
			" and " + std::string(magic_enum::enum_name(requester)) + " in the same cycle");
#endif
		m_started = true;
		m_startedBy = requester;
	}

	void InterpacketTimer::evaluate()
	{
		if (m_started)
			m_counter = 0;
		else if (m_counter.current() < m_saturation)
			m_counter = m_counter.current() + 1;
	}

	void InterpacketTimer::commit()
	{
		m_counter.commit();
		m_started = false;
	}

	void InterpacketTimer::reset()
	{
		m_counter.reset();
		m_started = false;
	}
}
