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
#include "IsochronousEndpoint.h"

#include "../../debug/DebugInterface.h"

namespace usblink::usb
{
	IsochronousStreamOutEndpoint::IsochronousStreamOutEndpoint(uint8_t number, size_t maxPacketSize, size_t bufferDepth) :
		Endpoint(EndpointAddress{ .number = number, .direction = EndpointDirection::out }),
		m_maxPacketSize(maxPacketSize),
		m_buffer(bufferDepth)
	{
		USBLINK_DESIGNCHECK_HINT(maxPacketSize <= 1024, "isochronous packets carry at most 1024 bytes");
	}

	void IsochronousStreamOutEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const State &cur = m_state.current();
		State next = m_state.next();

		m_buffer.evaluate();

		if (io.busReset)
		{
			m_buffer.discardPacket();
			next.receiving = false;
		}
		else if (io.tokenizer.newToken)
		{
			next.receiving = tokenTargetsUs(io.tokenizer.isOut());
			next.dropped = false;
			if (next.receiving)
				m_buffer.startPacket();
		}
		else if (cur.receiving)
		{
			if (io.rx.next && !cur.dropped && !m_buffer.pushByte(io.rx.payload))
			{
				next.dropped = true;
				if (!cur.overflow)
					dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_ENDPOINT
						<< "isochronous endpoint " << m_address.number << " dropped a packet, buffer full");
				next.overflow = true;
			}

			if (io.rxComplete)
			{
				next.receiving = false;
				if (next.dropped)
					m_buffer.discardPacket();
				else
				{
					m_buffer.acceptPacket();
					next.packetsReceived = cur.packetsReceived + 1;
				}
			}
			else if (io.rxInvalid)
			{
				next.receiving = false;
				m_buffer.discardPacket();
			}
		}

		m_state = next;
	}

	void IsochronousStreamOutEndpoint::commit()
	{
		m_buffer.commit();
		m_state.commit();
	}

	IsochronousStreamInEndpoint::IsochronousStreamInEndpoint(uint8_t number, size_t bytesPerFrame, size_t bufferDepth) :
		Endpoint(EndpointAddress{ .number = number, .direction = EndpointDirection::in }),
		m_bytesPerFrame(bytesPerFrame),
		m_fifo(bufferDepth)
	{
		m_stream.ready = true;
	}

	void IsochronousStreamInEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const State &cur = m_state.current();
		State next = cur;

		if (m_stream.transfer())
		{
			m_fifo.push(m_stream.payload);
			m_fifo.commitPush();
		}

		const TokenDetectorInterface &token = io.tokenizer;
		io.txPidToggle = 0;

		if (!cur.sending)
		{
			if (token.readyForResponse && tokenTargetsUs(token.isIn()))
			{
				const size_t count = std::min(m_bytesPerFrame, m_fifo.size());
				if (count == 0)
				{
					io.tx.valid = true;
					io.tx.last = true;
				}
				else
				{
					next.sending = true;
					next.first = true;
					next.remaining = count;
				}
			}
		}
		else
		{
			io.tx.valid = true;
			io.tx.first = cur.first;
			io.tx.last = cur.remaining == 1;
			io.tx.payload = m_fifo.peek();

			if (io.tx.ready)
			{
				m_fifo.pop();
				m_fifo.commitPop();
				next.first = false;
				next.remaining = cur.remaining - 1;
				next.sending = next.remaining != 0;
			}
		}

		m_state = next;
	}

	void IsochronousStreamInEndpoint::commit()
	{
		m_fifo.commit();
		m_state.commit();
		m_stream.ready = !m_fifo.full();
	}
}
