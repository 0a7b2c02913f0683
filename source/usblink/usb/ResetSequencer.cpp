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
#include "ResetSequencer.h"

namespace usblink::usb
{
	ResetSequencer::ResetSequencer(const BusTiming &timing, UsbSpeed maxSpeed) :
		m_timing(timing),
		m_maxSpeed(maxSpeed),
		m_state(State{ .speed = legacySpeed(), .speedBeforeSuspend = legacySpeed() })
	{
	}

	ResetSequencer::Controls ResetSequencer::controls() const
	{
		Controls legacy{
			.xcvrSelect = legacySpeed() == UsbSpeed::low ? XcvrSelect::lowSpeed : XcvrSelect::fullSpeed,
		};

		switch (m_state->phase)
		{
			case Phase::startHsDetection:
			case Phase::prepareForChirp0:
			case Phase::prepareForChirp1:
			case Phase::awaitHostK:
			case Phase::inHostK:
			case Phase::awaitHostJ:
			case Phase::inHostJ:
				return Controls{
					.opMode = OpMode::disableBitStuffing,
					.xcvrSelect = XcvrSelect::highSpeed,
				};

			case Phase::deviceChirp:
				// Chirp-K
				return Controls{
					.opMode = OpMode::disableBitStuffing,
					.xcvrSelect = XcvrSelect::highSpeed,
					.txValid = true,
					.txData = 0x00,
				};

			case Phase::isHighSpeed:
			case Phase::hsNonReset:
				return Controls{
					.xcvrSelect = XcvrSelect::highSpeed,
					.termSelect = false,
				};

			case Phase::detectHsSuspend:
				return Controls{ .xcvrSelect = XcvrSelect::fullSpeed };

			default:
				return legacy;
		}
	}

	void ResetSequencer::enterReset(State &next) const
	{
		next.busReset = true;
		next.counter = 0;
		next.idleCounter = 0;
		next.chirpPairs = 0;
		next.speed = legacySpeed();
		next.phase = m_maxSpeed == UsbSpeed::high ? Phase::startHsDetection : Phase::lsFsReset;
	}

	void ResetSequencer::fallBackToLegacySpeed(State &next) const
	{
		next.counter = 0;
		next.idleCounter = 0;
		next.chirpPairs = 0;
		next.speed = legacySpeed();
		next.phase = Phase::lsFsReset;
	}

	void ResetSequencer::evaluate(const UtmiInputs &utmi)
	{
		const State &cur = m_state.current();
		State next = cur;
		next.busReset = false;

		if (!utmi.vbusValid)
		{
			next = State{ .speed = legacySpeed(), .busReset = true, .speedBeforeSuspend = legacySpeed() };
			m_state = next;
			return;
		}

		const bool se0 = utmi.lineState == LineState::SE0;
		const uint8_t idleJ = LineState::idleJ(legacySpeed());

		switch (cur.phase)
		{
			case Phase::initialize:
				next.counter = 0;
				next.idleCounter = 0;
				next.phase = Phase::lsFsNonReset;
				break;

			case Phase::lsFsNonReset:
				next.counter = se0 ? cur.counter + 1 : 0;
				next.idleCounter = utmi.lineState == idleJ ? cur.idleCounter + 1 : 0;

				if (next.counter >= m_timing.resetDetect)
					enterReset(next);
				else if (next.idleCounter >= m_timing.suspendDetect)
				{
					next.speedBeforeSuspend = cur.speed;
					next.counter = 0;
					next.phase = Phase::suspended;
				}
				break;

			case Phase::lsFsReset:
				if (!se0)
				{
					next.counter = 0;
					next.idleCounter = 0;
					next.phase = Phase::lsFsNonReset;
				}
				break;

			case Phase::startHsDetection:
				next.phase = Phase::prepareForChirp0;
				break;

			case Phase::prepareForChirp0:
				next.phase = Phase::prepareForChirp1;
				break;

			case Phase::prepareForChirp1:
				next.counter = 0;
				next.phase = Phase::deviceChirp;
				break;

			case Phase::deviceChirp:
				next.counter = cur.counter + 1;
				if (next.counter >= m_timing.deviceChirp)
				{
					next.counter = 0;
					next.idleCounter = 0;
					next.chirpPairs = 0;
					next.phase = Phase::awaitHostK;
				}
				break;

			case Phase::awaitHostK:
			case Phase::awaitHostJ:
			{
				const uint8_t expected = cur.phase == Phase::awaitHostK ? LineState::K : LineState::J;
				next.idleCounter = cur.idleCounter + 1;
				if (utmi.lineState == expected)
				{
					next.counter = 1;
					next.phase = cur.phase == Phase::awaitHostK ? Phase::inHostK : Phase::inHostJ;
				}
				else if (next.idleCounter >= m_timing.hostChirpTimeout)
					fallBackToLegacySpeed(next);
				break;
			}

			case Phase::inHostK:
			case Phase::inHostJ:
			{
				const bool inK = cur.phase == Phase::inHostK;
				next.idleCounter = cur.idleCounter + 1;
				if (utmi.lineState != (inK ? LineState::K : LineState::J))
				{
					// too short to count as a chirp
					next.phase = inK ? Phase::awaitHostK : Phase::awaitHostJ;
				}
				else if (cur.counter + 1 >= m_timing.chirpFilter)
				{
					next.idleCounter = 0;
					if (inK)
						next.phase = Phase::awaitHostJ;
					else
					{
						next.chirpPairs = cur.chirpPairs + 1;
						next.phase = next.chirpPairs >= 3 ? Phase::isHighSpeed : Phase::awaitHostK;
					}
				}
				else
					next.counter = cur.counter + 1;

				if (next.phase != Phase::isHighSpeed && next.idleCounter >= m_timing.hostChirpTimeout)
					fallBackToLegacySpeed(next);
				break;
			}

			case Phase::isHighSpeed:
				next.speed = UsbSpeed::high;
				next.counter = 0;
				next.phase = Phase::hsNonReset;
				break;

			case Phase::hsNonReset:
				// squelch reads as SE0 in high speed
				next.counter = se0 ? cur.counter + 1 : 0;
				if (next.counter >= m_timing.suspendDetect)
				{
					next.counter = 0;
					next.speed = UsbSpeed::full;
					next.phase = Phase::detectHsSuspend;
				}
				break;

			case Phase::detectHsSuspend:
				next.counter = cur.counter + 1;
				if (next.counter >= m_timing.hsSuspendSettle)
				{
					if (utmi.lineState == LineState::J)
					{
						next.counter = 0;
						next.speedBeforeSuspend = UsbSpeed::high;
						next.phase = Phase::suspended;
					}
					else
						enterReset(next);
				}
				break;

			case Phase::suspended:
				if (utmi.lineState == LineState::resumeK(legacySpeed()))
				{
					next.counter = 0;
					next.idleCounter = 0;
					next.speed = cur.speedBeforeSuspend;
					next.phase = cur.speedBeforeSuspend == UsbSpeed::high ? Phase::hsNonReset : Phase::lsFsNonReset;
				}
				else
				{
					next.counter = se0 ? cur.counter + 1 : 0;
					if (next.counter >= m_timing.resetDetect)
						enterReset(next);
				}
				break;
		}

		m_state = next;
	}
}
