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

#include "RequestHandler.h"
#include "ControlDataTransmitter.h"

#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Serves class or vendor requests through callbacks.
	 * @details The IN callback is asked once per SETUP packet for the response of a control
	 * read, returning nullopt stalls the request. The OUT callback receives the data stage of
	 * a control write (empty without data stage) when the host asks for the status stage,
	 * returning false stalls the status stage.
	 */
	class CallbackRequestHandler : public RequestHandler
	{
	public:
		using InCallback = std::function<std::optional<std::vector<uint8_t>>(const SetupPacket&)>;
		using OutCallback = std::function<bool(const SetupPacket&, std::span<const uint8_t>)>;

		CallbackRequestHandler(SetupType type, InCallback onIn, OutCallback onOut, size_t maxPacketSize = 64);

		bool handlesRequest(const SetupPacket &setup) const override { return setup.type() == m_type; }

		void evaluate(RequestHandlerInterface &io) override;
		void commit() override;

	protected:
		struct State
		{
			bool stall = false;
			uint8_t expectedToggle = 1;
			bool statusDecided = false;
		};

		SetupType m_type;
		InCallback m_onIn;
		OutCallback m_onOut;
		ControlDataTransmitter m_transmitter;

		std::vector<uint8_t> m_packet;
		std::vector<uint8_t> m_received;
		sim::Reg<State> m_state;
	};
}
