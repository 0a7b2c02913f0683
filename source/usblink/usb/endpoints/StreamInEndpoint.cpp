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
#include "StreamInEndpoint.h"

namespace usblink::usb
{
	StreamInEndpoint::StreamInEndpoint(uint8_t number, size_t maxPacketSize) :
		Endpoint(EndpointAddress{ .number = number, .direction = EndpointDirection::in }),
		m_manager(maxPacketSize)
	{
		m_stream.ready = m_manager.transferReady();
	}

	void StreamInEndpoint::evaluate()
	{
		EndpointInterface &io = m_interface;
		const bool active = tokenTargetsUs(io.tokenizer.isIn());
		const bool resetSequence = io.busReset || io.activeConfig != m_activeConfig.current();

		m_manager.evaluate(io, m_stream, active, resetSequence);
		m_activeConfig = io.activeConfig;
	}

	void StreamInEndpoint::commit()
	{
		m_manager.commit();
		m_activeConfig.commit();
		m_stream.ready = m_manager.transferReady();
	}
}
