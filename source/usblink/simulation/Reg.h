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

namespace usblink::sim {

	/**
	 * @brief A clocked register holding a value of type T.
	 * @details Reads always return the value latched at the last clock edge while writes
	 * only become visible after commit(). Every component keeps its state in such registers
	 * so that all components of one clock cycle observe the same snapshot.
	 */
	template<typename T>
	class Reg
	{
	public:
		Reg() : m_resetValue{}, m_current{}, m_next{} { }
		explicit Reg(const T& resetValue) : m_resetValue(resetValue), m_current(resetValue), m_next(resetValue) { }

		const T& current() const { return m_current; }
		const T* operator -> () const { return &m_current; }
		const T& operator * () const { return m_current; }

		/// Sets the value that becomes visible after the next clock edge.
		Reg& operator = (const T& value) { m_next = value; return *this; }
		T& next() { return m_next; }

		/// Clock edge.
		void commit() { m_current = m_next; }
		/// Synchronous return to the power-up value.
		void reset() { m_current = m_next = m_resetValue; }

	private:
		T m_resetValue;
		T m_current;
		T m_next;
	};

}
