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
#include "pch.h"
#include <boost/test/unit_test.hpp>

#include <usblink/usb/ResetSequencer.h>

using namespace boost::unit_test;
using namespace usblink::usb;

namespace
{
	using Phase = ResetSequencer::Phase;

	class SequencerFixture
	{
	public:
		void setup(UsbSpeed maxSpeed)
		{
			m_sequencer.emplace(m_timing, maxSpeed);
			run(LineState::J, 10);
		}

		void run(uint8_t lineState, size_t cycles, bool vbus = true)
		{
			for (size_t i = 0; i < cycles; ++i)
				step(lineState, vbus);
		}

		bool runUntil(uint8_t lineState, Phase phase, size_t maxCycles)
		{
			for (size_t i = 0; i < maxCycles; ++i)
			{
				if (m_sequencer->phase() == phase)
					return true;
				step(lineState);
			}
			return m_sequencer->phase() == phase;
		}

		/// Host side of the chirp handshake after the device chirp ended.
		void hostChirps(size_t pairs)
		{
			for (size_t i = 0; i < pairs; ++i)
			{
				run(LineState::K, m_timing.chirpFilter * 2);
				run(LineState::J, m_timing.chirpFilter * 2);
			}
		}

		void enterHighSpeed()
		{
			setup(UsbSpeed::high);
			run(LineState::SE0, m_timing.resetDetect);
			BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::awaitHostK, m_timing.deviceChirp + 10));
			hostChirps(3);
			run(LineState::SE0, 10);
			BOOST_TEST_REQUIRE(m_sequencer->phase() == Phase::hsNonReset);
			m_resets = 0;
		}

	protected:
		void step(uint8_t lineState, bool vbus = true)
		{
			m_sequencer->evaluate(UtmiInputs{ .lineState = lineState, .vbusValid = vbus });
			m_sequencer->commit();
			if (m_sequencer->busReset())
				m_resets++;
		}

		BusTiming m_timing = BusTiming::forClock(60'000'000ull);
		std::optional<ResetSequencer> m_sequencer;
		size_t m_resets = 0;
	};
}

BOOST_FIXTURE_TEST_CASE(fs_reset_detected_once, SequencerFixture)
{
	setup(UsbSpeed::full);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);

	// eop and glitches are far shorter than a reset
	run(LineState::SE0, m_timing.resetDetect - 1);
	run(LineState::J, 10);
	BOOST_TEST(m_resets == 0);

	run(LineState::SE0, m_timing.resetDetect * 4);
	BOOST_TEST(m_resets == 1);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsReset);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);

	run(LineState::J, 10);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);
	BOOST_TEST(m_resets == 1);
}

BOOST_FIXTURE_TEST_CASE(fs_controls, SequencerFixture)
{
	setup(UsbSpeed::full);
	ResetSequencer::Controls controls = m_sequencer->controls();
	BOOST_TEST((controls.opMode == OpMode::normal));
	BOOST_TEST((controls.xcvrSelect == XcvrSelect::fullSpeed));
	BOOST_TEST(controls.termSelect);
	BOOST_TEST(!controls.txValid);
}

BOOST_FIXTURE_TEST_CASE(vbus_loss_holds_reset, SequencerFixture)
{
	setup(UsbSpeed::full);
	run(LineState::SE0, 5, false);
	BOOST_TEST(m_resets == 5);
	BOOST_TEST(m_sequencer->phase() == Phase::initialize);

	run(LineState::J, 5);
	BOOST_TEST(m_resets == 5);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);
}

BOOST_FIXTURE_TEST_CASE(fs_suspend_and_resume, SequencerFixture)
{
	setup(UsbSpeed::full);
	BOOST_TEST_REQUIRE(runUntil(LineState::J, Phase::suspended, m_timing.suspendDetect + 10));
	BOOST_TEST(m_sequencer->suspended());

	run(LineState::K, 5);
	BOOST_TEST(!m_sequencer->suspended());
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);
	BOOST_TEST(m_resets == 0);
}

BOOST_FIXTURE_TEST_CASE(reset_while_suspended, SequencerFixture)
{
	setup(UsbSpeed::full);
	BOOST_TEST_REQUIRE(runUntil(LineState::J, Phase::suspended, m_timing.suspendDetect + 10));

	run(LineState::SE0, m_timing.resetDetect + 5);
	BOOST_TEST(m_resets == 1);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsReset);
}

BOOST_FIXTURE_TEST_CASE(ls_device_idles_in_k, SequencerFixture)
{
	setup(UsbSpeed::low);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::low);
	BOOST_TEST((m_sequencer->controls().xcvrSelect == XcvrSelect::lowSpeed));

	// J is the resume state for low speed
	BOOST_TEST_REQUIRE(runUntil(LineState::K, Phase::suspended, m_timing.suspendDetect + 10));
	run(LineState::J, 2);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);
}

BOOST_FIXTURE_TEST_CASE(hs_chirp_handshake, SequencerFixture)
{
	setup(UsbSpeed::high);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);

	run(LineState::SE0, m_timing.resetDetect);
	BOOST_TEST(m_resets == 1);
	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::deviceChirp, 10));

	ResetSequencer::Controls chirp = m_sequencer->controls();
	BOOST_TEST(chirp.txValid);
	BOOST_TEST(chirp.txData == 0x00);
	BOOST_TEST((chirp.opMode == OpMode::disableBitStuffing));
	BOOST_TEST((chirp.xcvrSelect == XcvrSelect::highSpeed));
	BOOST_TEST(m_sequencer->busBusy());

	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::awaitHostK, m_timing.deviceChirp + 10));
	BOOST_TEST(!m_sequencer->controls().txValid);

	hostChirps(2);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
	hostChirps(1);
	run(LineState::SE0, 5);

	BOOST_TEST(m_sequencer->phase() == Phase::hsNonReset);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::high);
	BOOST_TEST(!m_sequencer->controls().termSelect);
	BOOST_TEST((m_sequencer->controls().opMode == OpMode::normal));
	BOOST_TEST(m_resets == 1);
}

BOOST_FIXTURE_TEST_CASE(hs_short_chirps_ignored, SequencerFixture)
{
	setup(UsbSpeed::high);
	run(LineState::SE0, m_timing.resetDetect);
	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::awaitHostK, m_timing.deviceChirp + 10));

	for (size_t i = 0; i < 10; ++i)
	{
		run(LineState::K, m_timing.chirpFilter / 2);
		run(LineState::J, m_timing.chirpFilter / 2);
	}
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
	BOOST_TEST(m_sequencer->phase() != Phase::hsNonReset);
}

BOOST_FIXTURE_TEST_CASE(hs_falls_back_without_host_chirps, SequencerFixture)
{
	setup(UsbSpeed::high);
	run(LineState::SE0, m_timing.resetDetect);
	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::awaitHostK, m_timing.deviceChirp + 10));

	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::lsFsReset, m_timing.hostChirpTimeout + 10));
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
	BOOST_TEST(m_sequencer->controls().termSelect);

	run(LineState::J, 5);
	BOOST_TEST(m_sequencer->phase() == Phase::lsFsNonReset);
}

BOOST_FIXTURE_TEST_CASE(hs_suspend_and_resume, SequencerFixture)
{
	enterHighSpeed();

	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::detectHsSuspend, m_timing.suspendDetect + 10));
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
	BOOST_TEST((m_sequencer->controls().xcvrSelect == XcvrSelect::fullSpeed));
	BOOST_TEST(m_sequencer->controls().termSelect);

	BOOST_TEST_REQUIRE(runUntil(LineState::J, Phase::suspended, m_timing.hsSuspendSettle + 10));
	BOOST_TEST(m_resets == 0);

	run(LineState::K, 2);
	BOOST_TEST(m_sequencer->phase() == Phase::hsNonReset);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::high);
}

BOOST_FIXTURE_TEST_CASE(hs_reset_restarts_chirp, SequencerFixture)
{
	enterHighSpeed();

	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::detectHsSuspend, m_timing.suspendDetect + 10));
	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::deviceChirp, m_timing.hsSuspendSettle + 10));
	BOOST_TEST(m_resets == 1);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
}

BOOST_FIXTURE_TEST_CASE(hs_non_idle_line_after_squelch_resets, SequencerFixture)
{
	enterHighSpeed();

	BOOST_TEST_REQUIRE(runUntil(LineState::SE0, Phase::detectHsSuspend, m_timing.suspendDetect + 10));
	BOOST_TEST_REQUIRE(runUntil(LineState::K, Phase::startHsDetection, m_timing.hsSuspendSettle + 10));
	BOOST_TEST(m_resets == 1);
	BOOST_TEST(m_sequencer->currentSpeed() == UsbSpeed::full);
}

BOOST_FIXTURE_TEST_CASE(hs_packets_keep_bus_awake, SequencerFixture)
{
	enterHighSpeed();

	for (size_t i = 0; i < 5; ++i)
	{
		run(LineState::SE0, m_timing.suspendDetect - 100);
		run(LineState::K, 10);
	}
	BOOST_TEST(m_sequencer->phase() == Phase::hsNonReset);
	BOOST_TEST(m_resets == 0);
}
