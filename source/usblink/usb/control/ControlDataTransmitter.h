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

#include "RequestHandler.h"
#include "../../simulation/Reg.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Sends the data stage of a control read.
	 * @details The response is clipped to wLength and split into packets of at most max
	 * packet size. The first packet goes out as DATA1 and the PID toggles on every ACK. A
	 * packet that was not acknowledged is sent again on the next IN token. If the response is
	 * shorter than requested and ends on a packet boundary, a zero length packet terminates
	 * the transfer. Once everything is acknowledged, further IN tokens are NAKed.
	 */
	class ControlDataTransmitter
	{
	public:
		enum class Phase
		{
			idle,
			sending,
			awaitAck,
		};

		ControlDataTransmitter(size_t maxPacketSize);

		/// Restarts the data stage with a new response, takes effect in the next cycle.
		void load(std::vector<uint8_t> response, uint16_t requestedLength);

		bool done() const;
		Phase phase() const { return m_state->phase; }
		size_t acknowledgedBytes() const { return m_state->position; }

		void evaluate(RequestHandlerInterface &io);
		void commit() { m_state.commit(); }
		void reset();

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			size_t position = 0;
			size_t sendPosition = 0;
			size_t packetEnd = 0;
			bool zlpPending = false;
			bool sentZlp = false;
			uint8_t dataPid = 1;
		};

		size_t m_maxPacketSize;
		std::vector<uint8_t> m_buffer;
		bool m_restart = false;
		bool m_zlpRequired = false;
		sim::Reg<State> m_state;
	};
}
