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
#include "../Descriptor.h"

namespace usblink::usb
{
	/**
	 * @brief Answers the standard requests of chapter 9 from a descriptor collection.
	 * @details SET_ADDRESS and SET_CONFIGURATION take effect once the host acknowledged the
	 * status stage. Requests that cannot be served are stalled.
	 */
	class StandardRequestHandler : public RequestHandler
	{
	public:
		enum class Action
		{
			none,
			setAddress,
			setConfiguration,
		};

		StandardRequestHandler(const Descriptor &descriptor, size_t maxPacketSize = 64);

		bool handlesRequest(const SetupPacket &setup) const override { return setup.isStandard(); }

		void evaluate(RequestHandlerInterface &io) override;
		void commit() override;

		bool stalling() const { return m_state->stall; }

	protected:
		struct State
		{
			Action action = Action::none;
			uint8_t value = 0;
			bool stall = false;
			bool statusSent = false;
		};

		void decode(const SetupPacket &setup, uint8_t activeConfig, State &next);

		const Descriptor &m_descriptor;
		ControlDataTransmitter m_transmitter;
		sim::Reg<State> m_state;
	};
}
