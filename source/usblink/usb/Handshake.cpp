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
#include "Handshake.h"

namespace usblink::usb
{
	void HandshakeDetector::evaluate(const UtmiInputs &utmi)
	{
		const State &cur = m_state.current();
		State next = cur;
		next.detected = {};

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
					if (pidCheckValid(utmi.rxData) && isHandshakePid(utmi.rxData & 0xF))
					{
						next.pid = utmi.rxData & 0xF;
						next.phase = Phase::awaitCompletion;
					}
					else
						next.phase = Phase::irrelevant;
				}
				break;

			case Phase::awaitCompletion:
				if (utmi.rxValid)
					next.phase = Phase::irrelevant;
				else if (!utmi.rxActive)
				{
					next.phase = Phase::idle;
					next.detected.ack = cur.pid == uint8_t(Pid::ack);
					next.detected.nak = cur.pid == uint8_t(Pid::nak);
					next.detected.stall = cur.pid == uint8_t(Pid::stall);
					next.detected.nyet = cur.pid == uint8_t(Pid::nyet);
				}
				break;

			case Phase::irrelevant:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				break;
		}

		m_state = next;
	}

	void HandshakeGenerator::evaluate(const HandshakeExchange &issue, bool txReady)
	{
		const State &cur = m_state.current();
		State next = cur;

		switch (cur.phase)
		{
			case Phase::idle:
				if (issue.any())
				{
					if (issue.ack)
						next.packet = pidByte(Pid::ack);
					else if (issue.nak)
						next.packet = pidByte(Pid::nak);
					else if (issue.stall)
						next.packet = pidByte(Pid::stall);
					else
						next.packet = pidByte(Pid::nyet);
					next.phase = Phase::transmit;
				}
				break;

			case Phase::transmit:
				if (txReady)
					next.phase = Phase::idle;
				break;
		}

		m_state = next;
	}
}
