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

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Returns the index of the candidate for which isActive holds.
	 * @details The link layer guarantees by protocol that at most one candidate is active. The
	 * number of active candidates is reported through activeCount so callers can check this.
	 */
	template<typename Candidate, typename Predicate>
	std::optional<size_t> selectActive(std::span<Candidate> candidates, Predicate isActive, size_t *activeCount = nullptr)
	{
		std::optional<size_t> selected;
		size_t count = 0;
		for (size_t i = 0; i < candidates.size(); ++i)
			if (isActive(candidates[i], i))
			{
				if (!selected)
					selected = i;
				count++;
			}

		if (activeCount)
			*activeCount = count;
		return selected;
	}

	/**
	 * @brief Connects many endpoint interfaces to the single set of shared signals.
	 * @details Inputs fan out unchanged. Strobes that are safe to combine are OR reduced,
	 * address and configuration changes are priority encoded and the transmit stream is
	 * selected one-hot by valid. The source that was valid in the previous cycle stays
	 * selected for one more cycle.
	 */
	class EndpointMultiplexer
	{
	public:
		void add(EndpointInterface &endpoint);
		size_t size() const { return m_endpoints.size(); }

		/// Copies the shared inputs into every endpoint and clears the endpoint outputs.
		void fanOut(const EndpointInterface &shared);
		/// Merges the endpoint outputs into the shared interface.
		void combine(EndpointInterface &shared);
		void commit();
		void reset();

		/// Endpoint selected as transmit source in the last combine.
		std::optional<size_t> transmitter() const { return m_transmitter; }
		/// Number of cycles in which more than one endpoint drove an exclusive signal.
		size_t conflicts() const { return m_conflicts; }
		bool conflictInLastCycle() const { return m_conflictInCycle; }

	protected:
		std::vector<EndpointInterface*> m_endpoints;
		std::vector<bool> m_txValidPrevious;
		std::vector<bool> m_txValidNext;

		std::optional<size_t> m_transmitter;
		size_t m_conflicts = 0;
		bool m_conflictInCycle = false;
	};
}
