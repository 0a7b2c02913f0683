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

#include "../Endpoint.h"
#include "RequestHandler.h"
#include "SetupDecoder.h"

#include <concepts>
#include <memory>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Bidirectional control endpoint running the SETUP, data and status stages.
	 * @details The stage machine only gates the token and packet strobes, everything that
	 * is sent, acknowledged or stalled is decided by the request handler responsible for the
	 * current SETUP packet. A new SETUP token restarts the machine from any stage.
	 */
	class ControlEndpoint : public Endpoint
	{
	public:
		enum class Phase
		{
			setup,
			dataIn,
			dataOut,
			statusIn,
			statusOut,
		};

		ControlEndpoint(uint8_t number = 0);

		template<std::derived_from<RequestHandler> T, typename... Args>
		T &addRequestHandler(Args&&... args);

		Phase phase() const { return m_state->phase; }
		const SetupPacket &setup() const { return m_state->setup; }
		size_t requestHandlerCount() const { return m_handlers.size(); }

		void finalize() override;
		void evaluate() override;
		void commit() override;

	protected:
		struct State
		{
			Phase phase = Phase::setup;
			SetupPacket setup;
		};

		SetupDecoder m_decoder;
		std::vector<std::unique_ptr<RequestHandler>> m_handlers;
		sim::Reg<State> m_state;
	};

	template<std::derived_from<RequestHandler> T, typename... Args>
	T &ControlEndpoint::addRequestHandler(Args&&... args)
	{
		auto handler = std::make_unique<T>(std::forward<Args>(args)...);
		T &ref = *handler;
		m_handlers.push_back(std::move(handler));
		return ref;
	}
}
