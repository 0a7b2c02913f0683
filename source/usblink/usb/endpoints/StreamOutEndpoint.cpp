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
#include "StreamOutEndpoint.h"

#include "../../debug/DebugInterface.h"

namespace usblink::usb
{
	StreamOutEndpoint::StreamOutEndpoint(uint8_t number, size_t maxPacketSize, size_t bufferDepth) :
		Endpoint(EndpointAddress{ .number = number, .direction = EndpointDirection::out }),
		m_maxPacketSize(maxPacketSize),
		m_buffer(bufferDepth)
	{
		USBLINK_DESIGNCHECK_HINT(bufferDepth >= maxPacketSize, "the buffer of an OUT endpoint must hold at least one packet");
	}

	void StreamOutEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const State &cur = m_state.current();
		State next = cur;

		m_buffer.evaluate();

		if (io.busReset || io.activeConfig != cur.activeConfig)
		{
			next.expectedToggle = 0;
			next.activeConfig = io.activeConfig;
		}

		const TokenDetectorInterface &token = io.tokenizer;
		if (io.busReset)
		{
			m_buffer.discardPacket();
			next.receiving = false;
			next.packetComplete = false;
		}
		else if (token.newToken)
		{
			next.receiving = tokenTargetsUs(token.isOut());
			next.accepting = next.receiving && m_buffer.space() >= m_maxPacketSize;
			next.packetComplete = false;
			if (next.receiving)
				m_buffer.startPacket();
		}
		else if (cur.receiving)
		{
			if (io.rx.next && cur.accepting)
				next.accepting = m_buffer.pushByte(io.rx.payload);

			if (io.rxComplete)
			{
				next.receiving = false;
				next.packetComplete = true;
			}
			else if (io.rxInvalid)
			{
				next.receiving = false;
				m_buffer.discardPacket();
			}
		}

		if (cur.packetComplete && io.rxReadyForResponse)
		{
			next.packetComplete = false;

			if (!cur.accepting)
			{
				io.handshakesOut.nak = true;
				m_buffer.discardPacket();
			}
			else if (io.rxPidToggle != cur.expectedToggle)
			{
				io.handshakesOut.ack = true;
				m_buffer.discardPacket();
				dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_ENDPOINT
					<< "endpoint " << m_address.number << " acknowledged a retransmitted packet again");
			}
			else
			{
				next.bytesReceived = cur.bytesReceived + m_buffer.packetBytes();
				next.expectedToggle = cur.expectedToggle ^ 1;
				const size_t spaceLeft = m_buffer.space();
				m_buffer.acceptPacket();

				if (io.speed == UsbSpeed::high && spaceLeft < m_maxPacketSize)
					io.handshakesOut.nyet = true;
				else
					io.handshakesOut.ack = true;
			}
		}

		if (token.readyForResponse && tokenTargetsUs(token.isPing()))
		{
			if (m_buffer.space() >= m_maxPacketSize)
				io.handshakesOut.ack = true;
			else
				io.handshakesOut.nak = true;
		}

		m_state = next;
	}

	void StreamOutEndpoint::commit()
	{
		m_buffer.commit();
		m_state.commit();
	}
}
