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
#include "SetupDecoder.h"

namespace usblink::usb
{
	void SetupDecoder::evaluate(const EndpointInterface &io, HandshakeExchange &handshakesOut)
	{
		const State &cur = m_state.current();
		State next = cur;
		next.received = false;

		if (cur.pendingAck && io.rxReadyForResponse)
		{
			handshakesOut.ack = true;
			next.pendingAck = false;
		}

		if (io.busReset)
		{
			m_state = State{};
			return;
		}

		if (io.tokenizer.newToken)
		{
			next.pendingAck = false;
			next.capturing = io.tokenizer.isSetup() && io.tokenizer.endpoint == m_endpoint && io.tokenizer.address == io.activeAddress;
			next.count = 0;
		}
		else if (cur.capturing)
		{
			if (io.rx.next)
			{
				if (cur.count < next.bytes.size())
					next.bytes[cur.count] = io.rx.payload;
				if (cur.count <= next.bytes.size())
					next.count = cur.count + 1;
			}

			if (io.rxComplete)
			{
				next.capturing = false;
				if (cur.count == next.bytes.size() && io.rxPidToggle == 0)
				{
					next.packet = SetupPacket::decode(cur.bytes);
					next.received = true;
					next.pendingAck = true;
				}
			}
			else if (io.rxInvalid)
				next.capturing = false;
		}

		m_state = next;
	}
}
