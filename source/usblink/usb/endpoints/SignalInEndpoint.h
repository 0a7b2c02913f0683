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

#include <cstdint>
#include <optional>
#include <vector>

namespace usblink::usb
{
	/**
	 * @brief Interrupt IN endpoint reporting a status word.
	 * @details On an IN token the current signal is latched and sent little endian. In
	 * onChange mode a value that was already acknowledged by the host is not sent again, the
	 * token is NAKed instead. An unacknowledged value is resent unchanged.
	 */
	class SignalInEndpoint : public Endpoint
	{
	public:
		enum class Mode
		{
			onChange,
			always,
		};

		enum class Phase
		{
			idle,
			transmit,
			waitForAck,
			retransmit,
		};

		SignalInEndpoint(uint8_t number, size_t widthBytes, Mode mode = Mode::onChange);

		void setSignal(uint64_t value);
		void setSignal(std::vector<uint8_t> value);
		/// Strobes for one cycle when the host acknowledged a report.
		bool reportCompleted() const { return m_state->reportCompleted; }
		Phase phase() const { return m_state->phase; }

		void evaluate() override;
		void commit() override;

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			std::vector<uint8_t> latched;
			std::optional<std::vector<uint8_t>> acknowledged;
			size_t position = 0;
			uint8_t dataPid = 0;
			uint8_t activeConfig = 0;
			bool reportCompleted = false;
		};

		Mode m_mode;
		std::vector<uint8_t> m_signal;
		sim::Reg<State> m_state;
	};
}
