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

#include "Pid.h"
#include "Utmi.h"
#include "../simulation/Reg.h"

#include <cstdint>

namespace usblink::usb
{
	/// One strobe per handshake type, in either direction.
	struct HandshakeExchange
	{
		bool ack = false;
		bool nak = false;
		bool stall = false;
		bool nyet = false;

		bool any() const { return ack || nak || stall || nyet; }

		HandshakeExchange &operator |= (const HandshakeExchange &rhs)
		{
			ack |= rhs.ack;
			nak |= rhs.nak;
			stall |= rhs.stall;
			nyet |= rhs.nyet;
			return *this;
		}
	};

	/// Strobes the received handshake for one cycle after the packet ended.
	class HandshakeDetector
	{
	public:
		enum class Phase
		{
			idle,
			readPid,
			awaitCompletion,
			irrelevant,
		};

		const HandshakeExchange &detected() const { return m_state->detected; }

		void evaluate(const UtmiInputs &utmi);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			uint8_t pid = 0;
			HandshakeExchange detected;
		};
		sim::Reg<State> m_state;
	};

	/**
	 * @brief Transmits single byte handshake packets.
	 * @details Requests are only accepted while idle. Simultaneous requests resolve as
	 * ack, nak, stall, nyet in that order.
	 */
	class HandshakeGenerator
	{
	public:
		enum class Phase
		{
			idle,
			transmit,
		};

		bool txValid() const { return m_state->phase == Phase::transmit; }
		uint8_t txData() const { return m_state->packet; }
		bool busy() const { return m_state->phase != Phase::idle; }

		void evaluate(const HandshakeExchange &issue, bool txReady);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			uint8_t packet = 0;
		};
		sim::Reg<State> m_state;
	};
}
