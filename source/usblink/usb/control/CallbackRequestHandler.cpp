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
#include "CallbackRequestHandler.h"

namespace usblink::usb
{
	CallbackRequestHandler::CallbackRequestHandler(SetupType type, InCallback onIn, OutCallback onOut, size_t maxPacketSize) :
		m_type(type),
		m_onIn(std::move(onIn)),
		m_onOut(std::move(onOut)),
		m_transmitter(maxPacketSize)
	{
	}

	void CallbackRequestHandler::evaluate(RequestHandlerInterface &io)
	{
		if (io.busReset)
		{
			m_transmitter.reset();
			m_packet.clear();
			m_received.clear();
			m_state = State{};
			return;
		}

		const State &cur = m_state.current();
		State next = cur;

		if (io.setupReceived)
		{
			next = State{};
			m_packet.clear();
			m_received.clear();

			std::optional<std::vector<uint8_t>> response;
			if (handlesRequest(io.setup) && io.setup.isIn() && io.setup.length > 0)
			{
				if (m_onIn)
					response = m_onIn(io.setup);
				next.stall = !response;
			}
			else if (handlesRequest(io.setup))
				next.stall = !m_onOut;

			if (response)
				m_transmitter.load(std::move(*response), io.setup.length);
			else
				m_transmitter.load({}, 0);
			m_transmitter.evaluate(io);
			m_state = next;
			return;
		}

		if (cur.stall)
		{
			if (io.dataRequested || io.statusRequested || io.rxReadyForResponse)
				io.handshakesOut.stall = true;
			m_state = next;
			return;
		}

		m_transmitter.evaluate(io);

		if (io.tokenizer.newToken || io.rxInvalid)
			m_packet.clear();
		if (io.rx.next)
			m_packet.push_back(io.rx.payload);

		if (io.rxReadyForResponse)
		{
			// a repeated toggle is a retransmission of a packet we already have
			if (io.rxPidToggle == cur.expectedToggle)
			{
				m_received.insert(m_received.end(), m_packet.begin(), m_packet.end());
				next.expectedToggle = cur.expectedToggle ^ 1;
			}
			m_packet.clear();
			io.handshakesOut.ack = true;
		}

		if (io.statusRequested)
		{
			if (io.setup.isIn() && io.setup.length > 0)
				io.handshakesOut.ack = true;
			else
			{
				bool accepted = cur.statusDecided || m_onOut(io.setup, m_received);
				next.statusDecided = true;
				if (accepted)
				{
					io.tx.valid = true;
					io.tx.last = true;
					io.txDataPid = 1;
				}
				else
				{
					next.stall = true;
					io.handshakesOut.stall = true;
				}
			}
		}

		m_state = next;
	}

	void CallbackRequestHandler::commit()
	{
		m_transmitter.commit();
		m_state.commit();
	}
}
