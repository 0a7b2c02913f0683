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
#include "InTransferManager.h"

namespace usblink::usb
{
	/// Bulk or interrupt IN endpoint sending a stream, packet boundaries follow stream.last.
	class StreamInEndpoint : public Endpoint
	{
	public:
		StreamInEndpoint(uint8_t number, size_t maxPacketSize = 512);

		/// valid, last and payload are driven by the application, ready by the endpoint.
		ByteStream &stream() { return m_stream; }
		InTransferManager &transferManager() { return m_manager; }

		void evaluate() override;
		void commit() override;

	protected:
		InTransferManager m_manager;
		ByteStream m_stream;
		sim::Reg<uint8_t> m_activeConfig;
	};
}
