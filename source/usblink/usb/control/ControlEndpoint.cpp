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
#include "ControlEndpoint.h"
#include "StandardRequestHandler.h"

#include "../../debug/DebugInterface.h"

#include <boost/format.hpp>

namespace usblink::usb
{
	ControlEndpoint::ControlEndpoint(uint8_t number) :
		Endpoint(EndpointAddress{ .number = number }),
		m_decoder(number)
	{
	}

	void ControlEndpoint::finalize()
	{
		if (m_handlers.size() == 1 && dynamic_cast<StandardRequestHandler*>(m_handlers.front().get()))
			addRequestHandler<StallOnlyRequestHandler>();
	}

	void ControlEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const State &cur = m_state.current();
		State next = cur;

		m_decoder.evaluate(io, io.handshakesOut);

		const TokenDetectorInterface &token = io.tokenizer;
		const bool setupToken = token.newToken && tokenTargetsUs(token.isSetup());
		const bool inRequested = token.readyForResponse && tokenTargetsUs(token.isIn());
		const bool pingRequested = token.readyForResponse && tokenTargetsUs(token.isPing());
		const bool outPacketAnswer = io.rxReadyForResponse && tokenTargetsUs(token.isOut());

		RequestHandlerInterface quiet{
			.setup = m_decoder.received() ? m_decoder.packet() : cur.setup,
			.setupReceived = m_decoder.received(),
			.tokenizer = token,
			.rxTimeout = io.timer.rxTimeout,
			.handshakesIn = io.handshakesIn,
			.speed = io.speed,
			.activeAddress = io.activeAddress,
			.activeConfig = io.activeConfig,
			.busReset = io.busReset,
		};
		quiet.tx.ready = io.tx.ready;

		RequestHandlerInterface request = quiet;
		switch (cur.phase)
		{
			case Phase::setup:
				break;
			case Phase::dataIn:
				request.dataRequested = inRequested;
				break;
			case Phase::dataOut:
				request.rx = io.rx;
				request.rxComplete = io.rxComplete;
				request.rxInvalid = io.rxInvalid;
				request.rxPidToggle = io.rxPidToggle;
				request.rxReadyForResponse = outPacketAnswer;
				break;
			case Phase::statusIn:
				request.statusRequested = inRequested;
				break;
			case Phase::statusOut:
				request.rxComplete = io.rxComplete;
				request.rxInvalid = io.rxInvalid;
				request.rxPidToggle = io.rxPidToggle;
				request.statusRequested = outPacketAnswer;
				break;
		}

		RequestHandler *responsible = nullptr;
		size_t responsibleCount = 0;
		for (auto &handler : m_handlers)
			if (handler->handlesRequest(request.setup))
			{
				if (!responsible)
					responsible = handler.get();
				responsibleCount++;
			}

		if (m_decoder.received() && responsibleCount != 1)
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_CONTROL
				<< (boost::format("%d request handlers responsible for request 0x%02x type 0x%02x")
					% responsibleCount % unsigned(request.setup.request) % unsigned(request.setup.requestType)).str());

		RequestHandlerInterface answer = request;
		for (auto &handler : m_handlers)
		{
			if (handler.get() == responsible)
				handler->evaluate(answer);
			else
			{
				RequestHandlerInterface ignored = quiet;
				handler->evaluate(ignored);
			}
		}

		if (!responsible && (request.dataRequested || request.statusRequested || request.rxReadyForResponse))
			answer.handshakesOut.stall = true;

		if (pingRequested && (cur.phase == Phase::dataOut || cur.phase == Phase::statusOut))
			answer.handshakesOut.ack = true;

		io.tx.valid = answer.tx.valid;
		io.tx.first = answer.tx.first;
		io.tx.last = answer.tx.last;
		io.tx.payload = answer.tx.payload;
		io.txPidToggle = answer.txDataPid;
		io.handshakesOut |= answer.handshakesOut;
		io.addressChanged = answer.addressChanged;
		io.newAddress = answer.newAddress;
		io.configChanged = answer.configChanged;
		io.newConfig = answer.newConfig;

		if (io.busReset)
			next = State{};
		else if (setupToken)
			next.phase = Phase::setup;
		else if (m_decoder.received())
		{
			next.setup = m_decoder.packet();
			if (next.setup.length == 0)
				next.phase = Phase::statusIn;
			else
				next.phase = next.setup.isIn() ? Phase::dataIn : Phase::dataOut;
		}
		else if (token.newToken)
		{
			if (cur.phase == Phase::dataIn && (tokenTargetsUs(token.isOut()) || tokenTargetsUs(token.isPing())))
				next.phase = Phase::statusOut;
			else if (cur.phase == Phase::dataOut && tokenTargetsUs(token.isIn()))
				next.phase = Phase::statusIn;
		}

		m_state = next;
	}

	void ControlEndpoint::commit()
	{
		m_decoder.commit();
		for (auto &handler : m_handlers)
			handler->commit();
		m_state.commit();
	}
}
