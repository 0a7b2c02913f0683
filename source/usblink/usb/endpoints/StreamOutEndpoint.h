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
#include "OutPacketBuffer.h"

#include <cstddef>
#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Bulk OUT endpoint writing received packets into a stream.
	 * @details A packet is only accepted if the buffer can hold a full packet when its token
	 * arrives, otherwise it is NAKed. A packet carrying the previous data toggle was already
	 * accepted once and is acknowledged again without being stored. At high speed a packet is
	 * answered with NYET if no room for a further packet remains.
	 */
	class StreamOutEndpoint : public Endpoint
	{
	public:
		StreamOutEndpoint(uint8_t number, size_t maxPacketSize = 512, size_t bufferDepth = 2048);

		ByteStream &stream() { return m_buffer.stream(); }
		size_t bytesReceived() const { return m_state->bytesReceived; }
		uint8_t expectedToggle() const { return m_state->expectedToggle; }

		void evaluate() override;
		void commit() override;

	protected:
		struct State
		{
			uint8_t expectedToggle = 0;
			uint8_t activeConfig = 0;
			bool receiving = false;
			bool accepting = false;
			bool packetComplete = false;
			size_t bytesReceived = 0;
		};

		size_t m_maxPacketSize;
		OutPacketBuffer m_buffer;
		sim::Reg<State> m_state;
	};
}
