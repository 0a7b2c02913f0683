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
#include "EndpointMultiplexer.h"

#include "../debug/DebugInterface.h"

namespace usblink::usb
{
	void EndpointMultiplexer::add(EndpointInterface &endpoint)
	{
		m_endpoints.push_back(&endpoint);
		m_txValidPrevious.push_back(false);
		m_txValidNext.push_back(false);
	}

	void EndpointMultiplexer::fanOut(const EndpointInterface &shared)
	{
		for (EndpointInterface *endpoint : m_endpoints)
		{
			endpoint->clearOutputs();
			endpoint->connectInputs(shared);
		}
	}

	void EndpointMultiplexer::combine(EndpointInterface &shared)
	{
		shared.clearOutputs();
		std::span<EndpointInterface*> endpoints = m_endpoints;
		size_t active = 0;
		m_conflictInCycle = false;

		auto selected = selectActive(endpoints, [](EndpointInterface *ep, size_t) { return ep->addressChanged; }, &active);
		if (selected)
		{
			shared.addressChanged = true;
			shared.newAddress = endpoints[*selected]->newAddress;
		}
		m_conflictInCycle |= active > 1;

		selected = selectActive(endpoints, [](EndpointInterface *ep, size_t) { return ep->configChanged; }, &active);
		if (selected)
		{
			shared.configChanged = true;
			shared.newConfig = endpoints[*selected]->newConfig;
		}
		m_conflictInCycle |= active > 1;

		selectActive(endpoints, [](EndpointInterface *ep, size_t) { return ep->handshakesOut.any(); }, &active);
		m_conflictInCycle |= active > 1;

		for (EndpointInterface *endpoint : m_endpoints)
		{
			shared.handshakesOut |= endpoint->handshakesOut;
			shared.timer.start |= endpoint->timer.start;
			shared.dataCrc.start |= endpoint->dataCrc.start;
		}

		m_transmitter = selectActive(endpoints, [](EndpointInterface *ep, size_t) { return ep->tx.valid; }, &active);
		m_conflictInCycle |= active > 1;
		if (!m_transmitter)
			m_transmitter = selectActive(endpoints, [this](EndpointInterface *, size_t i) { return bool(m_txValidPrevious[i]); });

		if (m_transmitter)
		{
			const EndpointInterface &source = *endpoints[*m_transmitter];
			shared.tx.valid = source.tx.valid;
			shared.tx.first = source.tx.first;
			shared.tx.last = source.tx.last;
			shared.tx.payload = source.tx.payload;
			shared.txPidToggle = source.txPidToggle;
		}

		for (size_t i = 0; i < endpoints.size(); ++i)
			m_txValidNext[i] = endpoints[i]->tx.valid;

		if (m_conflictInCycle)
		{
			m_conflicts++;
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_ENDPOINT
				<< "more than one endpoint drove an exclusive signal in the same cycle");
		}
	}

	void EndpointMultiplexer::commit()
	{
		m_txValidPrevious = m_txValidNext;
	}

	void EndpointMultiplexer::reset()
	{
		std::fill(m_txValidPrevious.begin(), m_txValidPrevious.end(), false);
		std::fill(m_txValidNext.begin(), m_txValidNext.end(), false);
		m_transmitter.reset();
	}
}
