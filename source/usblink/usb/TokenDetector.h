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

#include "Pid.h"
#include "Utmi.h"
#include "InterpacketTimer.h"
#include "../simulation/Reg.h"

#include <cstdint>

namespace usblink::usb
{
	/// Fields of the most recent token, latched until the next token arrives.
	struct TokenDetectorInterface
	{
		uint8_t pid = 0;
		uint8_t address = 0;
		uint8_t endpoint = 0;
		bool newToken = false;
		bool readyForResponse = false;

		uint16_t frame = 0;
		bool newFrame = false;

		bool isIn() const { return pid == uint8_t(Pid::in); }
		bool isOut() const { return pid == uint8_t(Pid::out); }
		bool isSetup() const { return pid == uint8_t(Pid::setup); }
		bool isPing() const { return pid == uint8_t(Pid::ping); }
	};

	/**
	 * @brief Decodes IN, OUT, SETUP, PING and SOF tokens from the UTMI receive stream.
	 * @details A token is reported one cycle after rx_active falls, provided its crc5 matched
	 * and, with address filtering enabled, it was sent to the current device address.
	 */
	class TokenDetector
	{
	public:
		enum class Phase
		{
			idle,
			readPid,
			readToken0,
			readToken1,
			tokenComplete,
			irrelevant,
		};

		TokenDetector(bool filterByAddress = true);

		/// Registered token fields plus the response window derived from the timer.
		TokenDetectorInterface outputs(const InterpacketTimerInterface &timer) const;

		void evaluate(const UtmiInputs &utmi, uint8_t deviceAddress, InterpacketTimerInterface &timer);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

		Phase phase() const { return m_state->phase; }

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			uint8_t currentPid = 0;
			uint16_t tokenData = 0;
			bool awaitingResponse = false;
			TokenDetectorInterface token;
		};

		bool m_filterByAddress;
		sim::Reg<State> m_state;
	};
}
