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

#include "../Endpoint.h"
#include "OutPacketBuffer.h"
#include "../../simulation/TransactionalFifo.h"

#include <cstddef>
#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Isochronous OUT endpoint.
	 * @details Packets are never acknowledged. Good packets are committed to the stream as a
	 * whole, packets with a bad crc or that did not fit are discarded. overflow() stays set
	 * once a packet was lost for lack of space.
	 */
	class IsochronousStreamOutEndpoint : public Endpoint
	{
	public:
		IsochronousStreamOutEndpoint(uint8_t number, size_t maxPacketSize = 1024, size_t bufferDepth = 4096);

		ByteStream &stream() { return m_buffer.stream(); }
		bool overflow() const { return m_state->overflow; }
		void clearOverflow() { m_state.next().overflow = false; }
		size_t packetsReceived() const { return m_state->packetsReceived; }

		void evaluate() override;
		void commit() override;

	protected:
		struct State
		{
			bool receiving = false;
			bool dropped = false;
			bool overflow = false;
			size_t packetsReceived = 0;
		};

		size_t m_maxPacketSize;
		OutPacketBuffer m_buffer;
		sim::Reg<State> m_state;
	};

	/**
	 * @brief Isochronous IN endpoint.
	 * @details Every IN token is answered with up to bytesPerFrame buffered bytes as DATA0,
	 * or with a zero length packet if nothing is buffered. There is no handshake.
	 */
	class IsochronousStreamInEndpoint : public Endpoint
	{
	public:
		IsochronousStreamInEndpoint(uint8_t number, size_t bytesPerFrame = 1024, size_t bufferDepth = 4096);

		/// valid and payload are driven by the application, ready by the endpoint.
		ByteStream &stream() { return m_stream; }
		void setBytesPerFrame(size_t bytes) { m_bytesPerFrame = bytes; }
		size_t level() const { return m_fifo.size(); }

		void evaluate() override;
		void commit() override;

	protected:
		struct State
		{
			bool sending = false;
			bool first = false;
			size_t remaining = 0;
		};

		size_t m_bytesPerFrame;
		sim::TransactionalFifo<uint8_t> m_fifo;
		ByteStream m_stream;
		sim::Reg<State> m_state;
	};
}
