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

#include "../Setup.h"
#include "../EndpointInterface.h"
#include "../../simulation/Reg.h"

#include <array>
#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Captures the DATA0 packet following a SETUP token to one endpoint.
	 * @details Packets with a payload other than 8 bytes, a DATA1 PID or a bad crc are
	 * dropped without handshake. An accepted packet is presented through packet() and
	 * received() strobes for one cycle, the ACK follows in the response window.
	 */
	class SetupDecoder
	{
	public:
		SetupDecoder(uint8_t endpoint) : m_endpoint(endpoint) { }

		bool received() const { return m_state->received; }
		const SetupPacket &packet() const { return m_state->packet; }

		void evaluate(const EndpointInterface &io, HandshakeExchange &handshakesOut);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			bool capturing = false;
			std::array<uint8_t, 8> bytes = {};
			uint8_t count = 0;

			SetupPacket packet;
			bool received = false;
			bool pendingAck = false;
		};

		uint8_t m_endpoint;
		sim::Reg<State> m_state;
	};
}
