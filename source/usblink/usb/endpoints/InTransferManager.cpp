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
#include "InTransferManager.h"

#include "../../utils/Exceptions.h"

namespace usblink::usb
{
	InTransferManager::InTransferManager(size_t maxPacketSize) :
		m_maxPacketSize(maxPacketSize)
	{
		USBLINK_DESIGNCHECK(maxPacketSize > 0);
	}

	bool InTransferManager::transferReady() const
	{
		return !m_state->buffers[m_state->fillIndex].complete;
	}

	void InTransferManager::evaluate(EndpointInterface &io, ByteStream &transfer, bool active, bool resetSequence)
	{
		const State &cur = m_state.current();
		State next = cur;

		const TokenDetectorInterface &token = io.tokenizer;
		const bool inTokenReceived = active && token.isIn() && token.readyForResponse;

		transfer.ready = transferReady();
		if (transfer.transfer())
		{
			Buffer &fill = next.buffers[cur.fillIndex];
			fill.data.push_back(transfer.payload);

			const bool packetComplete = fill.data.size() == m_maxPacketSize;
			if (packetComplete || transfer.last)
			{
				fill.complete = true;
				fill.zlpFollows = packetComplete && transfer.last && generateZlps;
				next.fillIndex = cur.fillIndex ^ 1;
			}
		}

		const Buffer &send = cur.buffers[cur.sendIndex];
		io.txPidToggle = cur.dataPid;

		switch (cur.phase)
		{
			case Phase::waitForToken:
				next.sendPosition = 0;
				if (inTokenReceived)
				{
					if (!send.complete)
						io.handshakesOut.nak = true;
					else if (send.data.empty())
					{
						io.tx.valid = true;
						io.tx.last = true;
						next.phase = Phase::waitForAck;
					}
					else
						next.phase = Phase::sendPacket;
				}
				break;

			case Phase::sendPacket:
			{
				const bool lastByte = cur.sendPosition + 1 == send.data.size();
				io.tx.valid = true;
				io.tx.first = cur.sendPosition == 0;
				io.tx.last = lastByte;
				io.tx.payload = send.data[cur.sendPosition];

				if (io.tx.ready)
				{
					next.sendPosition = cur.sendPosition + 1;
					if (lastByte)
						next.phase = Phase::waitForAck;
				}
				break;
			}

			case Phase::waitForAck:
				if (io.handshakesIn.ack)
				{
					next.dataPid = cur.dataPid ^ 1;

					Buffer &sent = next.buffers[cur.sendIndex];
					if (send.zlpFollows)
					{
						sent.data.clear();
						sent.zlpFollows = false;
					}
					else
					{
						sent = Buffer{};
						next.sendIndex = cur.sendIndex ^ 1;
					}
					next.phase = Phase::waitForToken;
				}
				else if (token.newToken)
					next.phase = Phase::waitForToken;
				break;
		}

		if (resetSequence)
			next.dataPid = startWithData1 ? 1 : 0;

		m_state = next;
	}
}
