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
#include "TokenDetector.h"

#include "Crc.h"

namespace usblink::usb
{
	TokenDetector::TokenDetector(bool filterByAddress) :
		m_filterByAddress(filterByAddress)
	{
	}

	TokenDetectorInterface TokenDetector::outputs(const InterpacketTimerInterface &timer) const
	{
		TokenDetectorInterface out = m_state->token;
		out.readyForResponse = m_state->awaitingResponse && timer.txAllowed;
		return out;
	}

	void TokenDetector::evaluate(const UtmiInputs &utmi, uint8_t deviceAddress, InterpacketTimerInterface &timer)
	{
		const State &cur = m_state.current();
		State next = cur;
		next.token.newToken = false;
		next.token.newFrame = false;

		// one response window per token, new bus activity ends it
		if (cur.awaitingResponse && (timer.txAllowed || utmi.rxActive))
			next.awaitingResponse = false;

		switch (cur.phase)
		{
			case Phase::idle:
				if (utmi.rxActive)
					next.phase = Phase::readPid;
				break;

			case Phase::readPid:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				else if (utmi.rxValid)
				{
					uint8_t pid = utmi.rxData & 0xF;
					if (pidCheckValid(utmi.rxData) && isTokenPid(pid))
					{
						next.currentPid = pid;
						next.phase = Phase::readToken0;
					}
					else
						next.phase = Phase::irrelevant;
				}
				break;

			case Phase::readToken0:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				else if (utmi.rxValid)
				{
					next.tokenData = utmi.rxData;
					next.phase = Phase::readToken1;
				}
				break;

			case Phase::readToken1:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				else if (utmi.rxValid)
				{
					uint16_t token = cur.tokenData | uint16_t(utmi.rxData) << 8;
					if (crc5UsbVerify(token))
					{
						next.tokenData = token & 0x7FF;
						next.phase = Phase::tokenComplete;
					}
					else
						next.phase = Phase::irrelevant;
				}
				break;

			case Phase::tokenComplete:
				if (utmi.rxValid)
					next.phase = Phase::irrelevant;
				else if (!utmi.rxActive)
				{
					next.phase = Phase::idle;

					if (cur.currentPid == uint8_t(Pid::sof))
					{
						next.token.frame = cur.tokenData;
						next.token.newFrame = true;
					}
					else
					{
						uint8_t address = cur.tokenData & 0x7F;
						if (!m_filterByAddress || address == deviceAddress)
						{
							next.token.pid = cur.currentPid;
							next.token.address = address;
							next.token.endpoint = uint8_t(cur.tokenData >> 7);
							next.token.newToken = true;
							next.awaitingResponse = true;
							timer.start = true;
						}
					}
				}
				break;

			case Phase::irrelevant:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				break;
		}

		m_state = next;
	}
}
