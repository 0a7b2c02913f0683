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

#include <usblink/utils/ConfigTree.h>
#include <usblink/usb/DeviceConfig.h>
#include <usblink/usb/SimuPhy.h>

#include <cstdlib>

using namespace boost::unit_test;
using namespace usblink;
using namespace usblink::usb;

BOOST_AUTO_TEST_CASE(globbing_match_path)
{
	BOOST_TEST((utils::globbingMatchPath("device", "device/speed") == "device"));
	BOOST_TEST((utils::globbingMatchPath("d*e", "device") == "device"));
	BOOST_TEST((utils::globbingMatchPath("a*", "ab/cd") == "ab"));
	BOOST_TEST(!utils::globbingMatchPath("x*", "device"));
	BOOST_TEST(!utils::globbingMatchPath("devices", "device"));
}

BOOST_AUTO_TEST_CASE(replace_env_vars)
{
	::setenv("USBLINK_TEST_VAR", "capture", 1);
	BOOST_TEST(utils::replaceEnvVars("$(USBLINK_TEST_VAR)/trace.vcd") == "capture/trace.vcd");
	BOOST_TEST(utils::replaceEnvVars("no variables") == "no variables");

	::unsetenv("USBLINK_TEST_MISSING");
	BOOST_CHECK_THROW(utils::replaceEnvVars("$(USBLINK_TEST_MISSING)"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(device_config_load)
{
	utils::ConfigTree config;
	config.loadFromString(
		"clock_frequency: 48000000\n"
		"max_speed: FULL\n"
		"filter_by_address: false\n"
	);

	DeviceConfig device;
	device.load(config);
	BOOST_TEST(sim::floor(device.clockFrequency) == 48'000'000u);
	BOOST_TEST(device.maxSpeed == UsbSpeed::full);
	BOOST_TEST(!device.filterByAddress);
	BOOST_CHECK_NO_THROW(device.validate());
}

BOOST_AUTO_TEST_CASE(device_config_keeps_defaults)
{
	utils::ConfigTree config;
	config.loadFromString("unrelated: 1\n");

	DeviceConfig device;
	device.load(config);
	BOOST_TEST(sim::floor(device.clockFrequency) == 60'000'000u);
	BOOST_TEST(device.maxSpeed == UsbSpeed::high);
	BOOST_TEST(device.filterByAddress);
}

BOOST_AUTO_TEST_CASE(device_config_rejects_unknown_speed)
{
	utils::ConfigTree config;
	config.loadFromString("max_speed: warp\n");

	DeviceConfig device;
	BOOST_CHECK_THROW(device.load(config), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(device_config_from_environment)
{
	::setenv("USBLINK_TEST_CLOCK", "30000000", 1);

	utils::ConfigTree config;
	config.loadFromString(
		"clock_frequency: $(USBLINK_TEST_CLOCK)\n"
		"max_speed: high\n"
	);

	DeviceConfig device;
	device.load(config);
	BOOST_TEST(sim::floor(device.clockFrequency) == 30'000'000u);
	BOOST_CHECK_THROW(device.validate(), utils::DesignError);
}

BOOST_AUTO_TEST_CASE(config_layers_and_sections)
{
	utils::ConfigTree config;
	config.loadFromString(
		"device:\n"
		"  max_speed: high\n"
		"  filter_by_address: false\n"
		"'*_phy':\n"
		"  interpacket_gap: 8\n"
		"  waveform_file: $(USBLINK_TEST_VAR)/trace.vcd\n"
	);
	config.loadFromString(
		"device:\n"
		"  max_speed: low\n"
	);
	::setenv("USBLINK_TEST_VAR", "capture", 1);

	DeviceConfig device;
	device.load(config["device"]);
	BOOST_TEST(device.maxSpeed == UsbSpeed::low);

	SimuPhyConfig phy;
	phy.load(config["simulated_phy"]);
	BOOST_TEST(phy.interpacketGap == 8);
	BOOST_TEST(phy.waveformFile == "capture/trace.vcd");
	BOOST_TEST(phy.receiveTimeout == 0);
}

BOOST_AUTO_TEST_CASE(config_sequences)
{
	utils::ConfigTree config;
	config.loadFromString("endpoints: [1, 2, 5]\n");

	utils::ConfigTree endpoints = config["endpoints"];
	BOOST_TEST(endpoints.isSequence());
	BOOST_TEST(endpoints.size() == 3);
	BOOST_TEST(endpoints[2].as<int>() == 5);

	size_t sum = 0;
	for (utils::ConfigTree ep : endpoints)
		sum += ep.as<size_t>();
	BOOST_TEST(sum == 8);

	BOOST_TEST(!config["missing"]);
	BOOST_TEST(config["missing"].as<int>(7) == 7);
}
