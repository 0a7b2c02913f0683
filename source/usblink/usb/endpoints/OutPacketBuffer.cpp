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
#include "OutPacketBuffer.h"

namespace usblink::usb
{
	OutPacketBuffer::OutPacketBuffer(size_t depth) :
		m_fifo(depth)
	{
	}

	size_t OutPacketBuffer::space() const
	{
		const size_t pending = m_state->pending ? 1 : 0;
		return m_fifo.space() - std::min(pending, m_fifo.space());
	}

	void OutPacketBuffer::startPacket()
	{
		m_fifo.rollbackPush();
		m_state.next().pending.reset();
		m_state.next().packetBytes = 0;
	}

	bool OutPacketBuffer::pushByte(uint8_t value)
	{
		State &next = m_state.next();
		// the held back byte needs its slot as well
		if (m_fifo.space() < (next.pending ? 2u : 1u))
			return false;
		if (next.pending)
			m_fifo.push(Beat{ .payload = *next.pending });
		next.pending = value;
		next.packetBytes++;
		return true;
	}

	void OutPacketBuffer::acceptPacket()
	{
		State &next = m_state.next();
		if (next.pending)
			m_fifo.push(Beat{ .payload = *next.pending, .last = true });
		m_fifo.commitPush();
		next.pending.reset();
		next.packetBytes = 0;
	}

	void OutPacketBuffer::discardPacket()
	{
		m_fifo.rollbackPush();
		m_state.next().pending.reset();
		m_state.next().packetBytes = 0;
	}

	void OutPacketBuffer::evaluate()
	{
		if (m_stream.transfer())
		{
			m_state.next().streamFirst = m_stream.last;
			m_fifo.pop();
			m_fifo.commitPop();
		}
	}

	void OutPacketBuffer::commit()
	{
		m_fifo.commit();
		m_state.commit();
		updateStream();
	}

	void OutPacketBuffer::reset()
	{
		m_fifo.reset();
		m_state.reset();
		updateStream();
	}

	void OutPacketBuffer::updateStream()
	{
		m_stream.valid = !m_fifo.empty();
		if (m_stream.valid)
		{
			m_stream.payload = m_fifo.peek().payload;
			m_stream.last = m_fifo.peek().last;
		}
		else
		{
			m_stream.payload = 0;
			m_stream.last = false;
		}
		m_stream.first = m_stream.valid && m_state->streamFirst;
	}
}
