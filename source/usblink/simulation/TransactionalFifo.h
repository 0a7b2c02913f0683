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

#include "../utils/Exceptions.h"

#include <cstddef>
#include <deque>
#include <vector>

namespace usblink::sim {

	/**
	 * @brief Clocked fifo whose push and pop sides can be committed or rolled back as transactions.
	 * @details Pushed elements stay invisible to the pop side until commitPush(), popped elements
	 * return with rollbackPop(). Requests of one cycle take effect in commit(), in the order pop,
	 * push, push commit or rollback, pop commit or rollback. All queries refer to the state
	 * latched at the last commit().
	 */
	template<typename TData>
	class TransactionalFifo
	{
	public:
		explicit TransactionalFifo(size_t depth) : m_depth(depth) { USBLINK_DESIGNCHECK(depth > 0); }

		size_t depth() const { return m_depth; }

		/// Slots neither committed nor staged, reduced by pushes requested in this cycle.
		size_t space() const { return m_depth - m_data.size() - m_staged.size() - m_pushRequests.size(); }
		bool full() const { return space() == 0; }
		size_t stagedSize() const { return m_staged.size(); }

		void push(const TData &value) { USBLINK_ASSERT(!full()); m_pushRequests.push_back(value); }
		void commitPush() { m_pushCommit = true; m_pushRollback = false; }
		void rollbackPush() { m_pushCommit = false; m_pushRollback = true; }

		/// Number of committed elements not yet popped.
		size_t size() const { return m_data.size() - m_popPosition; }
		bool empty() const { return size() == 0; }
		const TData &peek() const { USBLINK_ASSERT(!empty()); return m_data[m_popPosition]; }

		void pop() { USBLINK_ASSERT(!empty()); m_popRequested = true; }
		void commitPop() { m_popCommit = true; m_popRollback = false; }
		void rollbackPop() { m_popCommit = false; m_popRollback = true; }

		void commit()
		{
			if (m_popRequested)
				m_popPosition++;

			m_staged.insert(m_staged.end(), m_pushRequests.begin(), m_pushRequests.end());
			if (m_pushRollback)
				m_staged.clear();
			else if (m_pushCommit)
			{
				m_data.insert(m_data.end(), m_staged.begin(), m_staged.end());
				m_staged.clear();
			}

			if (m_popRollback)
				m_popPosition = 0;
			else if (m_popCommit)
			{
				m_data.erase(m_data.begin(), m_data.begin() + m_popPosition);
				m_popPosition = 0;
			}

			clearRequests();
		}

		void reset()
		{
			m_data.clear();
			m_staged.clear();
			m_popPosition = 0;
			clearRequests();
		}

	protected:
		void clearRequests()
		{
			m_pushRequests.clear();
			m_pushCommit = m_pushRollback = false;
			m_popRequested = false;
			m_popCommit = m_popRollback = false;
		}

		size_t m_depth;
		std::deque<TData> m_data;
		std::vector<TData> m_staged;
		size_t m_popPosition = 0;

		std::vector<TData> m_pushRequests;
		bool m_pushCommit = false;
		bool m_pushRollback = false;
		bool m_popRequested = false;
		bool m_popCommit = false;
		bool m_popRollback = false;
	};

}
