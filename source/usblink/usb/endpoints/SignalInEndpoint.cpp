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
#include "SignalInEndpoint.h"

#include "../../utils/Exceptions.h"

namespace usblink::usb
{
	SignalInEndpoint::SignalInEndpoint(uint8_t number, size_t widthBytes, Mode mode) :
		Endpoint(EndpointAddress{ .number = number, .direction = EndpointDirection::in }),
		m_mode(mode),
		m_signal(widthBytes, 0)
	{
		USBLINK_DESIGNCHECK_HINT(widthBytes > 0 && widthBytes <= 1024, "signal width must fit into one interrupt packet");
	}

	void SignalInEndpoint::setSignal(uint64_t value)
	{
		for (uint8_t &byte : m_signal)
		{
			byte = uint8_t(value);
			value >>= 8;
		}
	}

	void SignalInEndpoint::setSignal(std::vector<uint8_t> value)
	{
		USBLINK_DESIGNCHECK_HINT(value.size() == m_signal.size(), "signal width is fixed at construction");
		m_signal = std::move(value);
	}

	void SignalInEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const State &cur = m_state.current();
		State next = cur;
		next.reportCompleted = false;

		const TokenDetectorInterface &token = io.tokenizer;
		const bool packetRequested = token.readyForResponse && tokenTargetsUs(token.isIn());
		io.txPidToggle = cur.dataPid;

		switch (cur.phase)
		{
			case Phase::idle:
				if (packetRequested)
				{
					if (m_mode == Mode::always || cur.acknowledged != m_signal)
					{
						next.latched = m_signal;
						next.position = 0;
						next.phase = Phase::transmit;
					}
					else
						io.handshakesOut.nak = true;
				}
				break;

			case Phase::transmit:
			{
				const bool lastByte = cur.position + 1 == cur.latched.size();
				io.tx.valid = true;
				io.tx.first = cur.position == 0;
				io.tx.last = lastByte;
				io.tx.payload = cur.latched[cur.position];

				if (io.tx.ready)
				{
					next.position = cur.position + 1;
					if (lastByte)
						next.phase = Phase::waitForAck;
				}
				break;
			}

			case Phase::waitForAck:
				if (io.handshakesIn.ack)
				{
					next.acknowledged = cur.latched;
					next.dataPid = cur.dataPid ^ 1;
					next.reportCompleted = true;
					next.phase = Phase::idle;
				}
				else if (token.newToken)
					next.phase = Phase::retransmit;
				break;

			case Phase::retransmit:
				if (packetRequested)
				{
					next.position = 0;
					next.phase = Phase::transmit;
				}
				break;
		}

		if (io.busReset || io.activeConfig != cur.activeConfig)
		{
			next.dataPid = 0;
			next.acknowledged.reset();
			next.activeConfig = io.activeConfig;
			if (io.busReset)
				next.phase = Phase::idle;
		}

		m_state = next;
	}

	void SignalInEndpoint::commit()
	{
		m_state.commit();
	}
}
