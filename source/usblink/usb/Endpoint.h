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

#include "EndpointInterface.h"
#include "EndpointAddress.h"

#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Base of all endpoint handlers attached to a device.
	 * @details evaluate() reads the inputs of interface() and drives its outputs for the
	 * current cycle, computing the next state from the current one. commit() is the clock edge.
	 */
	class Endpoint
	{
	public:
		Endpoint(EndpointAddress address) : m_address(address) { }
		virtual ~Endpoint() = default;

		EndpointInterface &interface() { return m_interface; }
		const EndpointInterface &interface() const { return m_interface; }
		const EndpointAddress &address() const { return m_address; }

		/// Called once by the device before the first cycle.
		virtual void finalize() { }
		virtual void evaluate() = 0;
		virtual void commit() = 0;

	protected:
		/// The last token was of the given type and addressed to this endpoint.
		bool tokenTargetsUs(bool pidMatches) const
		{
			const TokenDetectorInterface &token = m_interface.tokenizer;
			return pidMatches && token.endpoint == m_address.number && token.address == m_interface.activeAddress;
		}

		EndpointAddress m_address;
		EndpointInterface m_interface;
	};
}
