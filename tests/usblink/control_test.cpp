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

#include <usblink/usb/control/CallbackRequestHandler.h>

#include "UsbFixture.h"
#include "LogCapture.h"

using namespace boost::unit_test;
using namespace usblink;
using namespace usblink::usb;

namespace
{
	const std::vector<uint8_t> ackPacket = { pidByte(Pid::ack) };
	const std::vector<uint8_t> stallPacket = { pidByte(Pid::stall) };
	const std::vector<uint8_t> nakPacket = { pidByte(Pid::nak) };

	SetupPacket getDescriptor(uint8_t type, uint8_t index, uint16_t length)
	{
		return SetupPacket{
			.requestType = 0x80,
			.request = uint8_t(SetupRequest::GET_DESCRIPTOR),
			.value = uint16_t(type << 8 | index),
			.length = length,
		};
	}
}

BOOST_FIXTURE_TEST_CASE(control_get_descriptor_packets, UsbFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;
	const size_t turnaround = m_device->timing().full.rxToTxMax;

	const std::vector<uint8_t> setup = { 0x80, 0x06, 0x00, 0x01, 0x00, 0x00, 0x08, 0x00 };
	phy.send(SimuHostController::tokenPacket(Pid::setup, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data0, setup));
	BOOST_TEST(phy.receive(turnaround) == ackPacket, boost::test_tools::per_element());
	BOOST_TEST(m_control->phase() == ControlEndpoint::Phase::dataIn);
	BOOST_TEST((m_control->setup() == SetupPacket::decode(std::span<const uint8_t, 8>(setup.data(), 8))));

	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	std::vector<uint8_t> response = phy.receive(turnaround);
	BOOST_TEST_REQUIRE(response.size() == 11);
	BOOST_TEST(response[0] == pidByte(Pid::data1));

	std::vector<uint8_t> device = *m_descriptor.find(DescriptorTypeId::device, 0);
	device.resize(8);
	BOOST_TEST(std::vector<uint8_t>(response.begin() + 1, response.end() - 2) == device, boost::test_tools::per_element());
	BOOST_TEST(crc16Usb(std::span<const uint8_t>(response).subspan(1, 8)) == uint16_t(response[9] | response[10] << 8));
	phy.send(ackPacket);

	phy.send(SimuHostController::tokenPacket(Pid::out, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data1, {}));
	BOOST_TEST(phy.receive(turnaround) == ackPacket, boost::test_tools::per_element());
	BOOST_TEST(m_control->phase() == ControlEndpoint::Phase::statusOut);

	phy.run(100);
	BOOST_TEST(phy.pendingPackets() == 0);
}

BOOST_FIXTURE_TEST_CASE(control_unacknowledged_data_is_resent, UsbFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;

	BOOST_TEST(m_host->transferSetup(getDescriptor(DescriptorTypeId::device, 0, 18)));

	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	const std::vector<uint8_t> first = phy.receive();
	BOOST_TEST_REQUIRE(first.size() == 21);

	// host missed the packet and asks again without acknowledging
	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	BOOST_TEST(phy.receive() == first, boost::test_tools::per_element());
	phy.send(ackPacket);

	phy.send(SimuHostController::tokenPacket(Pid::out, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data1, {}));
	BOOST_TEST(phy.receive() == ackPacket, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(control_setup_restarts_transfer, UsbFixture)
{
	setupDevice();

	BOOST_TEST(m_host->transferSetup(getDescriptor(DescriptorTypeId::configuration, 0, 255)));
	BOOST_TEST(m_control->phase() == ControlEndpoint::Phase::dataIn);

	// abandoned control read, a new request follows right away
	std::optional<std::vector<uint8_t>> status = m_host->controlTransferIn(SetupPacket{
		.requestType = 0x80,
		.request = uint8_t(SetupRequest::GET_STATUS),
		.length = 2,
	});
	BOOST_TEST_REQUIRE(status.has_value());
	BOOST_TEST(*status == std::vector<uint8_t>({ 0, 0 }), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(control_setup_always_acknowledged, UsbFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;

	// SETUP cannot be NAKed or stalled, not even for unknown requests
	const std::array<uint8_t, 8> bogus = { 0x41, 0xEE, 0x12, 0x34, 0x00, 0x00, 0x00, 0x00 };
	phy.send(SimuHostController::tokenPacket(Pid::setup, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data0, bogus));
	BOOST_TEST(phy.receive() == ackPacket, boost::test_tools::per_element());

	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	BOOST_TEST(phy.receive() == stallPacket, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(control_corrupted_setup_ignored, UsbFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;

	std::vector<uint8_t> setup = SimuHostController::dataPacket(Pid::data0, getDescriptor(DescriptorTypeId::device, 0, 8).encode());
	setup[3] ^= 0x01;
	phy.send(SimuHostController::tokenPacket(Pid::setup, 0x000));
	phy.send(setup);
	BOOST_TEST(phy.receive().empty());
	BOOST_TEST(m_control->phase() == ControlEndpoint::Phase::setup);
}

BOOST_FIXTURE_TEST_CASE(control_descriptors, UsbFixture)
{
	setupDevice();

	std::vector<uint8_t> device = m_host->readDescriptor(DescriptorTypeId::device, 0, 18);
	BOOST_TEST(device.size() == 18);
	BOOST_TEST(device[7] == m_maxPacketLength);

	// a short read returns the prefix only
	std::vector<uint8_t> prefix = m_host->readDescriptor(DescriptorTypeId::configuration, 0, 9);
	BOOST_TEST(prefix.size() == 9);
	const uint16_t totalLength = uint16_t(prefix[2] | prefix[3] << 8);
	BOOST_TEST(totalLength == 9 + 9 + 5 * 7);

	// a long read stops at the descriptor length
	std::vector<uint8_t> config = m_host->readDescriptor(DescriptorTypeId::configuration, 0, 1024);
	BOOST_TEST(config.size() == totalLength);
	BOOST_TEST(config == *m_descriptor.find(DescriptorTypeId::configuration, 0), boost::test_tools::per_element());

	std::vector<uint8_t> languages = m_host->readDescriptor(DescriptorTypeId::string, 0, 255);
	BOOST_TEST(languages == std::vector<uint8_t>({ 4, 3, 0x09, 0x04 }), boost::test_tools::per_element());

	std::vector<uint8_t> product = m_host->readDescriptor(DescriptorTypeId::string, 2, 255);
	BOOST_TEST(product.size() == 2 + 7 * 2);
	BOOST_TEST(product[2] == 'U');
	BOOST_TEST(product[3] == 0);
}

BOOST_FIXTURE_TEST_CASE(control_unknown_descriptor_stalls, UsbFixture)
{
	setupDevice();

	BOOST_TEST(!m_host->controlTransferIn(getDescriptor(DescriptorTypeId::string, 9, 255)));
	BOOST_TEST(!m_host->controlTransferIn(getDescriptor(DescriptorTypeId::configuration, 1, 255)));

	// the stall only lasts until the next SETUP
	BOOST_TEST(m_host->controlTransferIn(getDescriptor(DescriptorTypeId::device, 0, 18)).has_value());
}

class MultiPacketDescriptorFixture : public UsbFixture
{
public:
	void setupDescriptor(Descriptor &desc) override
	{
		desc.add(DeviceDescriptor{ .MaxPacketSize = m_maxPacketLength });
		desc.add(ConfigurationDescriptor{});
		for (uint8_t iface = 0; iface < m_interfaces; ++iface)
		{
			desc.add(InterfaceDescriptor{ .InterfaceNumber = iface });
			desc.add(EndpointDescriptor{ .Address = uint8_t(0x81 + iface) });
			desc.add(EndpointDescriptor{ .Address = uint8_t(0x01 + iface) });
		}
	}

	size_t totalLength() const { return 9 + m_interfaces * (9 + 2 * 7); }

protected:
	uint8_t m_interfaces = 4;
};

BOOST_FIXTURE_TEST_CASE(control_descriptor_spans_packets, MultiPacketDescriptorFixture)
{
	m_maxPacketLength = 8;
	setupDevice();

	std::vector<uint8_t> config = m_host->readDescriptor(DescriptorTypeId::configuration, 0, 1024);
	BOOST_TEST(config.size() == totalLength());
	BOOST_TEST(config[4] == 4);
	BOOST_TEST(m_host->nextDataPidIn(0) == Pid::data0);
}

BOOST_FIXTURE_TEST_CASE(control_descriptor_exact_multiple_ends_with_zlp, MultiPacketDescriptorFixture)
{
	m_maxPacketLength = 8;
	m_interfaces = 1;
	setupDevice();

	BOOST_TEST(totalLength() == 32);
	std::vector<uint8_t> config = m_host->readDescriptor(DescriptorTypeId::configuration, 0, 255);
	BOOST_TEST(config.size() == totalLength());
	BOOST_TEST(m_phy->pendingPackets() == 0);
}

BOOST_FIXTURE_TEST_CASE(control_set_address, UsbFixture)
{
	setupDevice();

	BOOST_TEST(m_host->controlSetAddress(42));
	BOOST_TEST(m_host->functionAddress() == 42);
	BOOST_TEST(m_device->address() == 42);

	// address 0 is no longer served
	m_host->functionAddress(0);
	m_host->sendToken(Pid::in, 0, 0);
	BOOST_TEST(m_phy->receive().empty());

	m_host->functionAddress(42);
	BOOST_TEST(m_host->readDescriptor(DescriptorTypeId::device, 0, 18).size() == 18);

	// back to the default address
	BOOST_TEST(m_host->controlSetAddress(0));
	BOOST_TEST(m_device->address() == 0);
}

BOOST_FIXTURE_TEST_CASE(control_set_address_waits_for_status_ack, UsbFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;

	m_host->transferSetup(SetupPacket{ .request = uint8_t(SetupRequest::SET_ADDRESS), .value = 17 });
	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	std::vector<uint8_t> status = phy.receive();
	BOOST_TEST(status == SimuHostController::dataPacket(Pid::data1, {}), boost::test_tools::per_element());

	// the ACK got lost, the address must not change yet
	phy.run(100);
	BOOST_TEST(m_device->address() == 0);

	phy.send(SimuHostController::tokenPacket(Pid::in, 0x000));
	BOOST_TEST(phy.receive() == status, boost::test_tools::per_element());
	phy.send(ackPacket);
	BOOST_TEST(m_device->address() == 17);
}

BOOST_FIXTURE_TEST_CASE(control_set_configuration, UsbFixture)
{
	setupDevice();
	const SetupPacket getConfiguration{ .requestType = 0x80, .request = uint8_t(SetupRequest::GET_CONFIGURATION), .length = 1 };

	BOOST_TEST(*m_host->controlTransferIn(getConfiguration) == std::vector<uint8_t>({ 0 }), boost::test_tools::per_element());

	BOOST_TEST(m_host->controlSetConfiguration(1));
	BOOST_TEST(m_device->configuration() == 1);
	BOOST_TEST(*m_host->controlTransferIn(getConfiguration) == std::vector<uint8_t>({ 1 }), boost::test_tools::per_element());

	// only existing configurations are accepted
	BOOST_TEST(!m_host->controlSetConfiguration(7));
	BOOST_TEST(m_device->configuration() == 1);

	BOOST_TEST(m_host->controlSetConfiguration(0));
	BOOST_TEST(m_device->configuration() == 0);
}

BOOST_FIXTURE_TEST_CASE(control_misc_standard_requests, UsbFixture)
{
	setupDevice();

	std::optional<std::vector<uint8_t>> iface = m_host->controlTransferIn(SetupPacket{
		.requestType = 0x81,
		.request = uint8_t(SetupRequest::GET_INTERFACE),
		.length = 1,
	});
	BOOST_TEST_REQUIRE(iface.has_value());
	BOOST_TEST(*iface == std::vector<uint8_t>({ 0 }), boost::test_tools::per_element());

	BOOST_TEST(m_host->controlTransferOut(SetupPacket{ .requestType = 0x01, .request = uint8_t(SetupRequest::SET_INTERFACE) }));
	BOOST_TEST(!m_host->controlTransferOut(SetupPacket{ .requestType = 0x01, .request = uint8_t(SetupRequest::SET_INTERFACE), .value = 1 }));
	BOOST_TEST(m_host->controlTransferOut(SetupPacket{ .requestType = 0x02, .request = uint8_t(SetupRequest::CLEAR_FEATURE) }));
	BOOST_TEST(!m_host->controlTransferIn(SetupPacket{ .requestType = 0x82, .request = uint8_t(SetupRequest::SYNCH_FRAME), .length = 2 }));
}

BOOST_FIXTURE_TEST_CASE(control_class_request_stalls_by_default, UsbFixture)
{
	LogCapture log;
	setupDevice();
	BOOST_TEST(m_control->requestHandlerCount() == 1);

	BOOST_TEST(!m_host->controlTransferIn(SetupPacket{ .requestType = 0xA1, .request = 0x01, .length = 4 }));
	BOOST_TEST(m_control->requestHandlerCount() == 2);
	BOOST_TEST(!m_host->controlTransferOut(SetupPacket{ .requestType = 0x21, .request = 0x0A }));

	BOOST_TEST(m_host->readDescriptor(DescriptorTypeId::device, 0, 18).size() == 18);
	BOOST_TEST(log.count(dbg::LogMessage::LOG_WARNING) == 0);
}

class VendorRequestFixture : public UsbFixture
{
public:
	VendorRequestFixture()
	{
		m_setupCallback.push_back([this](Device &) {
			m_control->addRequestHandler<CallbackRequestHandler>(SetupType::vendor,
				[this](const SetupPacket &setup) -> std::optional<std::vector<uint8_t>> {
					m_inRequests++;
					if (setup.request == 0x01)
						return std::vector<uint8_t>{ 1, 2, 3 };
					if (setup.request == 0x02)
						return counting(setup.value);
					return std::nullopt;
				},
				[this](const SetupPacket &setup, std::span<const uint8_t> data) {
					m_outData.emplace_back(data.begin(), data.end());
					return setup.request != 0xFF;
				},
				m_maxPacketLength);
		});
	}

protected:
	size_t m_inRequests = 0;
	std::vector<std::vector<uint8_t>> m_outData;
};

BOOST_FIXTURE_TEST_CASE(vendor_request_in, VendorRequestFixture)
{
	setupDevice();

	std::optional<std::vector<uint8_t>> data = m_host->controlTransferIn(SetupPacket{ .requestType = 0xC0, .request = 0x01, .length = 64 });
	BOOST_TEST_REQUIRE(data.has_value());
	BOOST_TEST(*data == std::vector<uint8_t>({ 1, 2, 3 }), boost::test_tools::per_element());
	BOOST_TEST(m_inRequests == 1);

	// truncated to the requested length
	data = m_host->controlTransferIn(SetupPacket{ .requestType = 0xC0, .request = 0x01, .length = 2 });
	BOOST_TEST_REQUIRE(data.has_value());
	BOOST_TEST(*data == std::vector<uint8_t>({ 1, 2 }), boost::test_tools::per_element());

	BOOST_TEST(!m_host->controlTransferIn(SetupPacket{ .requestType = 0xC0, .request = 0x03, .length = 8 }));

	// standard requests still work next to the vendor handler
	BOOST_TEST(m_host->readDescriptor(DescriptorTypeId::device, 0, 18).size() == 18);
	BOOST_TEST(m_control->requestHandlerCount() == 2);
}

BOOST_FIXTURE_TEST_CASE(vendor_request_in_zlp, VendorRequestFixture)
{
	setupDevice();

	// a response that fills whole packets but is shorter than requested ends with a zero length packet
	std::optional<std::vector<uint8_t>> data = m_host->controlTransferIn(SetupPacket{
		.requestType = 0xC0, .request = 0x02, .value = 128, .length = 200 });
	BOOST_TEST_REQUIRE(data.has_value());
	BOOST_TEST(*data == counting(128), boost::test_tools::per_element());
	BOOST_TEST(m_phy->pendingPackets() == 0);

	// no zero length packet if the host asked for exactly that much
	data = m_host->controlTransferIn(SetupPacket{ .requestType = 0xC0, .request = 0x02, .value = 128, .length = 128 });
	BOOST_TEST_REQUIRE(data.has_value());
	BOOST_TEST(data->size() == 128);
}

BOOST_FIXTURE_TEST_CASE(vendor_request_out, VendorRequestFixture)
{
	setupDevice();

	const std::vector<uint8_t> payload = counting(100, 0x30);
	BOOST_TEST(m_host->controlTransferOut(SetupPacket{ .requestType = 0x40, .request = 0x10, .length = 100 }, payload));
	BOOST_TEST_REQUIRE(m_outData.size() == 1);
	BOOST_TEST(m_outData[0] == payload, boost::test_tools::per_element());

	BOOST_TEST(m_host->controlTransferOut(SetupPacket{ .requestType = 0x40, .request = 0x11 }));
	BOOST_TEST_REQUIRE(m_outData.size() == 2);
	BOOST_TEST(m_outData[1].empty());

	BOOST_TEST(!m_host->controlTransferOut(SetupPacket{ .requestType = 0x40, .request = 0xFF }));
	BOOST_TEST(m_inRequests == 0);
}

BOOST_FIXTURE_TEST_CASE(vendor_request_out_retransmission, VendorRequestFixture)
{
	setupDevice();
	SimuPhy &phy = *m_phy;

	m_host->transferSetup(SetupPacket{ .requestType = 0x40, .request = 0x10, .length = 4 });

	const std::vector<uint8_t> payload = { 9, 8, 7, 6 };
	phy.send(SimuHostController::tokenPacket(Pid::out, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data1, payload));
	BOOST_TEST(phy.receive() == ackPacket, boost::test_tools::per_element());

	// the ACK was lost, the same packet again must not be appended twice
	phy.send(SimuHostController::tokenPacket(Pid::out, 0x000));
	phy.send(SimuHostController::dataPacket(Pid::data1, payload));
	BOOST_TEST(phy.receive() == ackPacket, boost::test_tools::per_element());

	std::optional<std::vector<uint8_t>> status = m_host->transferIn(0);
	BOOST_TEST_REQUIRE(status.has_value());
	BOOST_TEST(status->empty());
	BOOST_TEST_REQUIRE(m_outData.size() == 1);
	BOOST_TEST(m_outData[0] == payload, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(control_ping_during_data_out, VendorRequestFixture)
{
	setupDevice();

	m_host->transferSetup(SetupPacket{ .requestType = 0x40, .request = 0x10, .length = 4 });
	BOOST_TEST((m_host->ping(0) == Pid::ack));
}
