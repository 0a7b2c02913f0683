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
#include "ControlDataTransmitter.h"

#include "../../utils/Exceptions.h"

namespace usblink::usb
{
	ControlDataTransmitter::ControlDataTransmitter(size_t maxPacketSize) :
		m_maxPacketSize(maxPacketSize)
	{
		USBLINK_DESIGNCHECK_HINT(maxPacketSize > 0, "control endpoints need a max packet size of at least 8 bytes");
	}

	void ControlDataTransmitter::load(std::vector<uint8_t> response, uint16_t requestedLength)
	{
		if (response.size() > requestedLength)
			response.resize(requestedLength);

		m_zlpRequired = response.size() < requestedLength && response.size() % m_maxPacketSize == 0;
		m_buffer = std::move(response);
		m_restart = true;
	}

	bool ControlDataTransmitter::done() const
	{
		return m_state->position == m_buffer.size() && !m_state->zlpPending;
	}

	void ControlDataTransmitter::reset()
	{
		m_state.reset();
		m_buffer.clear();
		m_restart = false;
		m_zlpRequired = false;
	}

	void ControlDataTransmitter::evaluate(RequestHandlerInterface &io)
	{
		if (m_restart)
		{
			m_restart = false;
			m_state = State{ .zlpPending = m_zlpRequired };
			return;
		}

		const State &cur = m_state.current();
		State next = cur;

		switch (cur.phase)
		{
			case Phase::idle:
				if (!io.dataRequested)
					break;

				io.txDataPid = cur.dataPid;
				if (cur.position < m_buffer.size())
				{
					next.sendPosition = cur.position;
					next.packetEnd = std::min(m_buffer.size(), cur.position + m_maxPacketSize);
					next.sentZlp = false;
					next.phase = Phase::sending;
				}
				else if (cur.zlpPending)
				{
					io.tx.valid = true;
					io.tx.last = true;
					next.sentZlp = true;
					next.phase = Phase::awaitAck;
				}
				else
					io.handshakesOut.nak = true;
				break;

			case Phase::sending:
				io.txDataPid = cur.dataPid;
				io.tx.valid = true;
				io.tx.payload = m_buffer[cur.sendPosition];
				io.tx.first = cur.sendPosition == cur.position;
				io.tx.last = cur.sendPosition + 1 == cur.packetEnd;

				if (io.tx.ready)
				{
					next.sendPosition = cur.sendPosition + 1;
					if (io.tx.last)
						next.phase = Phase::awaitAck;
				}
				break;

			case Phase::awaitAck:
				if (io.handshakesIn.ack)
				{
					if (cur.sentZlp)
						next.zlpPending = false;
					else
						next.position = cur.packetEnd;
					next.dataPid = cur.dataPid ^ 1;
					next.phase = Phase::idle;
				}
				else if (io.tokenizer.newToken || io.rxTimeout)
				{
					// not acknowledged, the next IN token receives the same packet again
					next.phase = Phase::idle;
				}
				break;
		}

		m_state = next;
	}
}
