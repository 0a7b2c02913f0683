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

#include <usblink/usb/EndpointMultiplexer.h>

#include "LogCapture.h"

#include <array>

using namespace boost::unit_test;
using namespace usblink;
using namespace usblink::usb;

BOOST_AUTO_TEST_CASE(select_active_first_wins)
{
	std::array<int, 5> values = { 0, 3, 0, 7, 0 };
	size_t active = 0;

	auto selected = selectActive(std::span<int>(values), [](int v, size_t) { return v != 0; }, &active);
	BOOST_TEST_REQUIRE(selected.has_value());
	BOOST_TEST(*selected == 1);
	BOOST_TEST(active == 2);

	selected = selectActive(std::span<int>(values), [](int v, size_t) { return v > 100; }, &active);
	BOOST_TEST(!selected);
	BOOST_TEST(active == 0);

	selected = selectActive(std::span<int>(values), [](int, size_t i) { return i == 4; });
	BOOST_TEST((selected == 4u));
}

class MultiplexerFixture
{
public:
	MultiplexerFixture()
	{
		for (EndpointInterface &ep : m_endpoints)
			m_mux.add(ep);
	}

	void cycle()
	{
		m_mux.combine(m_shared);
		m_mux.commit();
	}

protected:
	LogCapture m_log;
	std::array<EndpointInterface, 3> m_endpoints;
	EndpointMultiplexer m_mux;
	EndpointInterface m_shared;
};

BOOST_FIXTURE_TEST_CASE(multiplexer_fans_out_inputs, MultiplexerFixture)
{
	EndpointInterface shared;
	shared.tokenizer.pid = uint8_t(Pid::in);
	shared.tokenizer.endpoint = 2;
	shared.tokenizer.readyForResponse = true;
	shared.activeAddress = 9;
	shared.tx.ready = true;
	shared.timer.txAllowed = true;
	shared.dataCrc.crc = 0x1234;

	m_endpoints[1].tx.valid = true;
	m_endpoints[1].handshakesOut.nak = true;
	m_mux.fanOut(shared);

	for (const EndpointInterface &ep : m_endpoints)
	{
		BOOST_TEST(ep.tokenizer.isIn());
		BOOST_TEST(ep.tokenizer.endpoint == 2);
		BOOST_TEST(ep.tokenizer.readyForResponse);
		BOOST_TEST(ep.activeAddress == 9);
		BOOST_TEST(ep.tx.ready);
		BOOST_TEST(ep.timer.txAllowed);
		BOOST_TEST(ep.dataCrc.crc == 0x1234);
		BOOST_TEST(!ep.tx.valid);
		BOOST_TEST(!ep.handshakesOut.any());
	}
}

BOOST_FIXTURE_TEST_CASE(multiplexer_selects_transmitter, MultiplexerFixture)
{
	m_endpoints[2].tx.valid = true;
	m_endpoints[2].tx.first = true;
	m_endpoints[2].tx.payload = 0x42;
	m_endpoints[2].txPidToggle = 1;
	cycle();

	BOOST_TEST((m_mux.transmitter() == 2u));
	BOOST_TEST(m_shared.tx.valid);
	BOOST_TEST(m_shared.tx.first);
	BOOST_TEST(m_shared.tx.payload == 0x42);
	BOOST_TEST(m_shared.txPidToggle == 1);
	BOOST_TEST(m_mux.conflicts() == 0);

	// the last source stays selected for one cycle after valid dropped
	m_endpoints[2].tx = {};
	m_endpoints[2].txPidToggle = 1;
	cycle();
	BOOST_TEST((m_mux.transmitter() == 2u));
	BOOST_TEST(!m_shared.tx.valid);
	BOOST_TEST(m_shared.txPidToggle == 1);

	cycle();
	BOOST_TEST(!m_mux.transmitter());
	BOOST_TEST(m_shared.txPidToggle == 0);
}

BOOST_FIXTURE_TEST_CASE(multiplexer_or_reduces_strobes, MultiplexerFixture)
{
	m_endpoints[0].handshakesOut.ack = true;
	m_endpoints[1].timer.start = true;
	m_endpoints[2].dataCrc.start = true;
	cycle();

	BOOST_TEST(m_shared.handshakesOut.ack);
	BOOST_TEST(!m_shared.handshakesOut.nak);
	BOOST_TEST(m_shared.timer.start);
	BOOST_TEST(m_shared.dataCrc.start);
	BOOST_TEST(m_mux.conflicts() == 0);
}

BOOST_FIXTURE_TEST_CASE(multiplexer_reports_conflicts, MultiplexerFixture)
{
	m_endpoints[0].addressChanged = true;
	m_endpoints[0].newAddress = 3;
	m_endpoints[2].addressChanged = true;
	m_endpoints[2].newAddress = 7;
	cycle();

	BOOST_TEST(m_shared.addressChanged);
	BOOST_TEST(m_shared.newAddress == 3);
	BOOST_TEST(m_mux.conflictInLastCycle());
	BOOST_TEST(m_mux.conflicts() == 1);
	BOOST_TEST(m_log.count(dbg::LogMessage::LOG_WARNING) == 1);

	m_endpoints[0] = EndpointInterface{};
	m_endpoints[2] = EndpointInterface{};
	m_endpoints[0].handshakesOut.nak = true;
	m_endpoints[1].handshakesOut.ack = true;
	cycle();
	BOOST_TEST(m_mux.conflicts() == 2);

	m_endpoints[0] = EndpointInterface{};
	m_endpoints[1] = EndpointInterface{};
	m_endpoints[0].tx.valid = true;
	m_endpoints[1].tx.valid = true;
	cycle();
	BOOST_TEST(m_mux.conflicts() == 3);
	BOOST_TEST((m_mux.transmitter() == 0u));

	m_endpoints[0] = EndpointInterface{};
	m_endpoints[1] = EndpointInterface{};
	m_endpoints[1].configChanged = true;
	m_endpoints[1].newConfig = 1;
	cycle();
	BOOST_TEST(!m_mux.conflictInLastCycle());
	BOOST_TEST(m_shared.configChanged);
	BOOST_TEST(m_shared.newConfig == 1);
	BOOST_TEST(m_mux.conflicts() == 3);
}
