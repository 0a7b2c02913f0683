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

#include "Stream.h"
#include "TokenDetector.h"
#include "Handshake.h"
#include "InterpacketTimer.h"
#include "DataPacket.h"
#include "Utmi.h"

#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Everything an endpoint handler sees of and drives into the shared link layer.
	 * @details Fields marked as outputs are cleared by the multiplexer before every cycle.
	 */
	struct EndpointInterface
	{
		// inputs
		TokenDetectorInterface tokenizer;

		UsbOutStream rx;
		bool rxComplete = false;
		bool rxReadyForResponse = false;
		bool rxInvalid = false;
		/// data PID selector of the last received packet
		uint8_t rxPidToggle = 0;

		HandshakeExchange handshakesIn;

		UsbSpeed speed = UsbSpeed::full;
		uint8_t activeAddress = 0;
		uint8_t activeConfig = 0;
		bool busReset = false;

		// inputs and outputs
		ByteStream tx;
		InterpacketTimerInterface timer;
		DataCrcInterface dataCrc;

		// outputs
		uint8_t txPidToggle = 0;
		HandshakeExchange handshakesOut;

		bool addressChanged = false;
		uint8_t newAddress = 0;
		bool configChanged = false;
		uint8_t newConfig = 0;

		/// Drops everything the endpoint drove in the previous cycle.
		void clearOutputs()
		{
			tx.valid = false;
			tx.first = false;
			tx.last = false;
			tx.payload = 0;
			txPidToggle = 0;
			timer.start = false;
			dataCrc.start = false;
			handshakesOut = {};
			addressChanged = false;
			newAddress = 0;
			configChanged = false;
			newConfig = 0;
		}

		/// Takes over all inputs of another interface.
		void connectInputs(const EndpointInterface &shared)
		{
			tokenizer = shared.tokenizer;
			rx = shared.rx;
			rxComplete = shared.rxComplete;
			rxReadyForResponse = shared.rxReadyForResponse;
			rxInvalid = shared.rxInvalid;
			rxPidToggle = shared.rxPidToggle;
			handshakesIn = shared.handshakesIn;
			speed = shared.speed;
			activeAddress = shared.activeAddress;
			activeConfig = shared.activeConfig;
			busReset = shared.busReset;
			tx.ready = shared.tx.ready;
			timer.txAllowed = shared.timer.txAllowed;
			timer.txTimeout = shared.timer.txTimeout;
			timer.rxTimeout = shared.timer.rxTimeout;
			dataCrc.crc = shared.dataCrc.crc;
		}
	};
}
