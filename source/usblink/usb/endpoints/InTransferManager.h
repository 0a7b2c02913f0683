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

#include "../EndpointInterface.h"
#include "../../simulation/Reg.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Splits a transfer stream into IN packets of at most max packet size.
	 * @details Two packet buffers alternate: one fills from the transfer stream while the
	 * other waits for its IN token and acknowledgement. IN tokens are NAKed until a packet is
	 * complete. A packet that is not acknowledged is sent again on the next IN token. With
	 * generateZlps, a transfer ending on a packet boundary is followed by a zero length packet.
	 */
	class InTransferManager
	{
	public:
		enum class Phase
		{
			waitForToken,
			sendPacket,
			waitForAck,
		};

		InTransferManager(size_t maxPacketSize);

		bool generateZlps = true;
		bool startWithData1 = false;

		/// The transfer stream accepts a byte in this cycle.
		bool transferReady() const;
		uint8_t dataPid() const { return m_state->dataPid; }
		Phase phase() const { return m_state->phase; }

		/**
		 * @param io Drives tx, txPidToggle and the NAK handshake.
		 * @param transfer valid, last and payload are inputs, ready is driven.
		 * @param active The last token was addressed to this endpoint.
		 * @param resetSequence Reloads the data toggle from startWithData1.
		 */
		void evaluate(EndpointInterface &io, ByteStream &transfer, bool active, bool resetSequence);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct Buffer
		{
			std::vector<uint8_t> data;
			bool complete = false;
			bool zlpFollows = false;
		};

		struct State
		{
			std::array<Buffer, 2> buffers;
			uint8_t fillIndex = 0;
			uint8_t sendIndex = 0;
			Phase phase = Phase::waitForToken;
			size_t sendPosition = 0;
			uint8_t dataPid = 0;
		};

		size_t m_maxPacketSize;
		sim::Reg<State> m_state;
	};
}
