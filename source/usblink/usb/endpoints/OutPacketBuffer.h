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

#include "../Stream.h"
#include "../../simulation/Reg.h"
#include "../../simulation/TransactionalFifo.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace usblink::usb
{
	/**
	 * @brief Receive buffer of OUT endpoints presenting whole packets as a framed byte stream.
	 * @details Bytes of a packet are staged and only become visible on the application side
	 * once the packet is accepted. The last byte of every packet is held back until the packet
	 * ends so it can be marked as last.
	 */
	class OutPacketBuffer
	{
	public:
		OutPacketBuffer(size_t depth);

		/// Free space, counting the bytes of the packet in flight as used.
		size_t space() const;
		size_t packetBytes() const { return m_state->packetBytes; }

		void startPacket();
		/// Returns false and drops the byte if the buffer is full.
		bool pushByte(uint8_t value);
		void acceptPacket();
		void discardPacket();

		/// Application side, driven between evaluate() calls.
		ByteStream &stream() { return m_stream; }
		const ByteStream &stream() const { return m_stream; }
		/// Number of committed bytes waiting for the application.
		size_t level() const { return m_fifo.size(); }

		void evaluate();
		void commit();
		void reset();

	protected:
		struct Beat
		{
			uint8_t payload = 0;
			bool last = false;
		};

		struct State
		{
			std::optional<uint8_t> pending;
			size_t packetBytes = 0;
			bool streamFirst = true;
		};

		void updateStream();

		sim::TransactionalFifo<Beat> m_fifo;
		sim::Reg<State> m_state;
		ByteStream m_stream;
	};
}
