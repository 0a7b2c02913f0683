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
#pragma once

#include "../Setup.h"
#include "../Stream.h"
#include "../TokenDetector.h"
#include "../Handshake.h"
#include "../Utmi.h"

#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Signals exchanged between the control endpoint and one request handler.
	 * @details The control endpoint gates the strobes by transfer stage, a handler only sees
	 * dataRequested, statusRequested and rxReadyForResponse while its request is active.
	 */
	struct RequestHandlerInterface
	{
		// inputs
		SetupPacket setup;
		/// strobes once when a new SETUP packet has been accepted, for every handler
		bool setupReceived = false;

		TokenDetectorInterface tokenizer;
		UsbOutStream rx;
		bool rxComplete = false;
		bool rxInvalid = false;
		/// answer window for a DATA packet of the OUT data stage
		bool rxReadyForResponse = false;
		uint8_t rxPidToggle = 0;
		bool rxTimeout = false;

		HandshakeExchange handshakesIn;

		/// IN token of the data stage is waiting for data, NAK or STALL
		bool dataRequested = false;
		/// IN token or OUT packet of the status stage is waiting for its answer
		bool statusRequested = false;

		UsbSpeed speed = UsbSpeed::full;
		uint8_t activeAddress = 0;
		uint8_t activeConfig = 0;
		bool busReset = false;

		// outputs, tx.ready is an input
		ByteStream tx;
		uint8_t txDataPid = 0;
		HandshakeExchange handshakesOut;

		bool addressChanged = false;
		uint8_t newAddress = 0;
		bool configChanged = false;
		uint8_t newConfig = 0;
	};

	/// Serves a class of control requests on a control endpoint.
	class RequestHandler
	{
	public:
		virtual ~RequestHandler() = default;

		/// Responsibility of handlers registered on the same endpoint must not overlap.
		virtual bool handlesRequest(const SetupPacket &setup) const = 0;

		virtual void evaluate(RequestHandlerInterface &io) = 0;
		virtual void commit() = 0;
	};

	/// Stalls every request it is responsible for, non standard requests by default.
	class StallOnlyRequestHandler : public RequestHandler
	{
	public:
		using Predicate = bool(*)(const SetupPacket &);

		StallOnlyRequestHandler();
		StallOnlyRequestHandler(Predicate predicate) : m_predicate(predicate) { }

		bool handlesRequest(const SetupPacket &setup) const override { return m_predicate(setup); }

		void evaluate(RequestHandlerInterface &io) override;
		void commit() override { }

	protected:
		Predicate m_predicate;
	};
}
