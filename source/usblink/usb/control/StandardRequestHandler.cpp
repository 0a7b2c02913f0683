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
#include "StandardRequestHandler.h"

#include "../../debug/DebugInterface.h"

#include <magic_enum.hpp>

namespace usblink::usb
{
	StandardRequestHandler::StandardRequestHandler(const Descriptor &descriptor, size_t maxPacketSize) :
		m_descriptor(descriptor),
		m_transmitter(maxPacketSize)
	{
	}

	void StandardRequestHandler::decode(const SetupPacket &setup, uint8_t activeConfig, State &next)
	{
		std::vector<uint8_t> response;

		switch (SetupRequest(setup.request))
		{
			case SetupRequest::GET_DESCRIPTOR:
				if (auto descriptor = m_descriptor.find(setup.valueHigh(), setup.valueLow()))
					response = std::move(*descriptor);
				else
					next.stall = true;
				break;

			case SetupRequest::GET_CONFIGURATION:
				response = { activeConfig };
				break;

			case SetupRequest::GET_STATUS:
				response = { 0, 0 };
				break;

			case SetupRequest::GET_INTERFACE:
				response = { 0 };
				break;

			case SetupRequest::SET_ADDRESS:
				next.stall = setup.value > 127;
				next.action = Action::setAddress;
				next.value = uint8_t(setup.value);
				break;

			case SetupRequest::SET_CONFIGURATION:
				next.stall = setup.value > 255 || (setup.value != 0 && !m_descriptor.hasConfiguration(uint8_t(setup.value)));
				next.action = Action::setConfiguration;
				next.value = uint8_t(setup.value);
				break;

			case SetupRequest::SET_FEATURE:
			case SetupRequest::CLEAR_FEATURE:
				break;

			case SetupRequest::SET_INTERFACE:
				next.stall = setup.value != 0;
				break;

			default:
				next.stall = true;
				break;
		}

		if (setup.isIn() && setup.length > 0 && !next.stall)
			m_transmitter.load(std::move(response), setup.length);
		else
			m_transmitter.load({}, 0);

		if (next.stall)
		{
			auto name = magic_enum::enum_name(SetupRequest(setup.request));
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_CONTROL
				<< "stalling standard request " << (name.empty() ? std::to_string(setup.request) : std::string(name))
				<< " value " << setup.value << " index " << setup.index);
		}
	}

	void StandardRequestHandler::evaluate(RequestHandlerInterface &io)
	{
		if (io.busReset)
		{
			m_transmitter.reset();
			m_state = State{};
			return;
		}

		const State &cur = m_state.current();
		State next = cur;

		if (io.tokenizer.newToken)
			next.statusSent = false;

		if (io.setupReceived)
		{
			next = State{};
			if (handlesRequest(io.setup))
				decode(io.setup, io.activeConfig, next);
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

		if (io.rxReadyForResponse)
			io.handshakesOut.stall = true; // no standard request carries an OUT data stage

		if (io.statusRequested)
		{
			if (io.setup.isIn() && io.setup.length > 0)
				io.handshakesOut.ack = true;
			else
			{
				io.tx.valid = true;
				io.tx.last = true;
				io.txDataPid = 1;
				next.statusSent = true;
			}
		}

		if (cur.statusSent && io.handshakesIn.ack)
		{
			switch (cur.action)
			{
				case Action::setAddress:
					io.addressChanged = true;
					io.newAddress = cur.value;
					break;
				case Action::setConfiguration:
					io.configChanged = true;
					io.newConfig = cur.value;
					break;
				case Action::none:
					break;
			}
			next.statusSent = false;
			next.action = Action::none;
		}

		m_state = next;
	}

	void StandardRequestHandler::commit()
	{
		m_transmitter.commit();
		m_state.commit();
	}
}
