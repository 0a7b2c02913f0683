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
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
#include <boost/crc.hpp>

#include <usblink/usb/Crc.h>

using namespace boost::unit_test;
using namespace usblink::usb;

using UsbCrc16 = boost::crc_optimal<16, 0x8005, 0xFFFF, 0xFFFF, true, true>;

BOOST_AUTO_TEST_CASE(crc5_token_fields)
{
	BOOST_TEST(crc5Usb(0x000, 11) == 0x02);
	BOOST_TEST(crc5Usb(0x05C, 11) == 0x1C);
	BOOST_TEST(crc5Usb(0x003, 11) == 0x0A);
	BOOST_TEST(crc5Usb(0x53A, 11) == 0x07);
}

BOOST_AUTO_TEST_CASE(crc5_residue)
{
	for (uint16_t field = 0; field < 0x800; ++field)
	{
		uint16_t token = crc5UsbGenerate(field);
		BOOST_TEST((token & 0x7FF) == field);
		BOOST_TEST(crc5Usb(token, 16) == crc5UsbResidue);
		BOOST_TEST(crc5UsbVerify(token));
		BOOST_TEST(!crc5UsbVerify(token ^ 0x0100));
	}
}

BOOST_AUTO_TEST_CASE(crc16_setup_packets)
{
	const std::vector<uint8_t> setAddress = { 0x00, 0x05, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00 };
	BOOST_TEST(crc16Usb(setAddress) == 0xBCEB);

	const std::vector<uint8_t> getDescriptor64 = { 0x80, 0x06, 0x00, 0x01, 0x00, 0x00, 0x40, 0x00 };
	BOOST_TEST(crc16Usb(getDescriptor64) == 0x94DD);

	const std::vector<uint8_t> getDescriptor8 = { 0x80, 0x06, 0x00, 0x01, 0x00, 0x00, 0x08, 0x00 };
	BOOST_TEST(crc16Usb(getDescriptor8) == 0x94EB);

	BOOST_TEST(crc16Usb({}) == 0);
}

BOOST_DATA_TEST_CASE(crc16_matches_boost_crc, data::xrange(1, 70, 3), length)
{
	std::vector<uint8_t> payload;
	for (int i = 0; i < length; ++i)
		payload.push_back(uint8_t(i * 37 + 11));

	UsbCrc16 ref;
	ref.process_bytes(payload.data(), payload.size());
	BOOST_TEST(crc16Usb(payload) == ref.checksum());

	const uint16_t crc = crc16Usb(payload);
	payload.push_back(uint8_t(crc));
	payload.push_back(uint8_t(crc >> 8));

	CrcState state{ .params = CrcParams::init(CrcWellKnownParams::CRC_16_USB) };
	state.init();
	state.update(payload);
	BOOST_TEST(state.checksum() == crc16UsbResidue);
}

BOOST_AUTO_TEST_CASE(crc_state_is_copyable_midway)
{
	const std::vector<uint8_t> payload = { 1, 2, 3, 4, 5, 6 };

	CrcState state{ .params = CrcParams::init(CrcWellKnownParams::CRC_16_USB) };
	state.init();
	state.update(std::span(payload).first(3));

	CrcState fork = state;
	fork.update(std::span(payload).subspan(3));
	state.update(std::span(payload).subspan(3));

	BOOST_TEST(fork.checksum() == state.checksum());
	BOOST_TEST(fork.checksum() == crc16Usb(payload));
}
