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

#include "Utmi.h"
#include "BusTiming.h"
#include "../simulation/Reg.h"

#include <cstddef>
#include <cstdint>

namespace usblink::usb
{
	/**
	 * @brief Watches the line state for bus resets, suspend and resume and negotiates the
	 * bus speed through the high speed chirp handshake (USB 2.0 section 7.1.7.5).
	 * @details All durations are cycle counts taken from BusTiming. The PHY controls are a
	 * function of the current phase, the bus reset strobe and the speed are registered.
	 */
	class ResetSequencer
	{
	public:
		enum class Phase
		{
			initialize,
			lsFsNonReset,
			lsFsReset,
			startHsDetection,
			prepareForChirp0,
			prepareForChirp1,
			deviceChirp,
			awaitHostK,
			inHostK,
			awaitHostJ,
			inHostJ,
			isHighSpeed,
			hsNonReset,
			detectHsSuspend,
			suspended,
		};

		struct Controls
		{
			OpMode opMode = OpMode::normal;
			XcvrSelect xcvrSelect = XcvrSelect::fullSpeed;
			bool termSelect = true;
			bool txValid = false;
			uint8_t txData = 0;
		};

		/// @param maxSpeed high enables the chirp handshake, low makes this a low speed device.
		ResetSequencer(const BusTiming &timing, UsbSpeed maxSpeed);

		Phase phase() const { return m_state->phase; }
		bool busReset() const { return m_state->busReset; }
		bool suspended() const { return m_state->phase == Phase::suspended; }
		UsbSpeed currentSpeed() const { return m_state->speed; }
		/// The sequencer owns the transmit lines while chirping.
		bool busBusy() const { return m_state->phase == Phase::deviceChirp; }
		Controls controls() const;

		void evaluate(const UtmiInputs &utmi);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			Phase phase = Phase::initialize;
			UsbSpeed speed = UsbSpeed::full;
			bool busReset = false;
			size_t counter = 0;
			size_t idleCounter = 0;
			uint8_t chirpPairs = 0;
			UsbSpeed speedBeforeSuspend = UsbSpeed::full;
		};

		void enterReset(State &next) const;
		void fallBackToLegacySpeed(State &next) const;
		UsbSpeed legacySpeed() const { return m_maxSpeed == UsbSpeed::low ? UsbSpeed::low : UsbSpeed::full; }

		const BusTiming &m_timing;
		UsbSpeed m_maxSpeed;
		sim::Reg<State> m_state;
	};
}
