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
#include "SimuPhy.h"

#include "../debug/DebugInterface.h"
#include "../utils/ConfigTree.h"
#include "../utils/Exceptions.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/format.hpp>
#include <magic_enum.hpp>

namespace usblink::usb
{
	void SimuPhyConfig::load(const utils::ConfigTree &config)
	{
		waveformFile = config["waveform_file"].as(waveformFile);
		interpacketGap = config["interpacket_gap"].as(interpacketGap);
		receiveTimeout = config["receive_timeout"].as(receiveTimeout);
	}

	std::string describePacket(std::span<const uint8_t> packet)
	{
		if (packet.empty())
			return "nothing";

		if (!pidCheckValid(packet[0]))
			return (boost::format("invalid PID %02X") % unsigned(packet[0])).str();

		const Pid pid = Pid(packet[0] & 0xF);
		const std::string name = boost::algorithm::to_upper_copy(std::string(magic_enum::enum_name(pid)));

		if (isTokenPid(uint8_t(pid)) && packet.size() == 3)
		{
			const uint16_t field = uint16_t(packet[1] | packet[2] << 8) & 0x7FF;
			if (pid == Pid::sof)
				return (boost::format("SOF frame %d") % field).str();
			return (boost::format("%s addr %d ep %d") % name % (field & 0x7F) % (field >> 7)).str();
		}

		if (isDataPid(uint8_t(pid)) && packet.size() >= 3)
			return (boost::format("%s %d bytes") % name % (packet.size() - 3)).str();

		if (packet.size() == 1)
			return name;

		return (boost::format("%s, %d bytes") % name % packet.size()).str();
	}

	SimuPhy::SimuPhy(Device &device, SimuPhyConfig config) :
		m_device(device),
		m_config(std::move(config))
	{
		USBLINK_DESIGNCHECK_HINT(m_config.interpacketGap > 0, "the receive path needs at least one idle cycle between packets");

		if (!m_config.waveformFile.empty())
		{
			m_trace = std::make_unique<sim::TraceRecorder>(m_config.waveformFile, m_device.config().clockFrequency);
			m_trace->addScope<UtmiInputs>("utmi_in", [this] { return m_inputs; });
			m_trace->addScope<UtmiOutputs>("utmi_out", [this] { return m_device.outputs(); });
			m_trace->addScope<DeviceState>("device", [this] { return m_device.state(); });
		}
	}

	SimuPhy::~SimuPhy() = default;

	uint8_t SimuPhy::idleLineState() const
	{
		// high speed idle is squelch, which the PHY reports as SE0
		if (m_device.speed() == UsbSpeed::high)
			return LineState::SE0;
		return LineState::idleJ(m_device.speed());
	}

	bool SimuPhy::deviceChirping() const
	{
		const UtmiOutputs &out = m_device.outputs();
		return out.txValid && out.opMode == OpMode::disableBitStuffing;
	}

	void SimuPhy::annotate(std::string_view text)
	{
		if (m_trace)
			m_trace->annotate(text);
	}

	void SimuPhy::step()
	{
		for (auto &process : m_processes)
			process(cycle());

		m_inputs.txReady = m_txReady;
		if (!m_driving)
		{
			m_inputs.rxActive = false;
			m_inputs.rxValid = false;
			m_inputs.rxError = false;
			m_inputs.lineState = m_lineOverride ? *m_lineOverride : idleLineState();
		}
		if (deviceChirping())
			m_inputs.lineState = LineState::K;

		const uint64_t now = cycle();
		collect(m_device.tick(m_inputs));

		if (m_trace)
			m_trace->sample(now);
	}

	void SimuPhy::collect(const UtmiOutputs &outputs)
	{
		if (outputs.txValid && outputs.opMode == OpMode::normal)
		{
			if (m_inputs.txReady)
				m_transmitting.push_back(outputs.txData);
			return;
		}

		if (m_transmitting.empty())
			return;

		annotate("device " + describePacket(m_transmitting));
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_PACKET << dbg::LogMessage::Cycle{ cycle() }
			<< "device sent " << describePacket(m_transmitting) << ": " << dbg::LogMessage::Packet{ m_transmitting });

		m_received.push_back(std::move(m_transmitting));
		m_transmitting.clear();
	}

	void SimuPhy::run(size_t cycles)
	{
		for (size_t i = 0; i < cycles; ++i)
			step();
	}

	bool SimuPhy::runUntil(const std::function<bool()> &condition, size_t maxCycles)
	{
		for (size_t i = 0; i < maxCycles; ++i)
		{
			if (condition())
				return true;
			step();
		}
		return condition();
	}

	void SimuPhy::send(std::span<const uint8_t> packet, std::optional<size_t> rxErrorAt)
	{
		USBLINK_ASSERT(!packet.empty());

		const std::vector<uint8_t> bytes(packet.begin(), packet.end());
		annotate("host " + describePacket(bytes));
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_PACKET << dbg::LogMessage::Cycle{ cycle() }
			<< "host sent " << describePacket(bytes) << ": " << dbg::LogMessage::Packet{ bytes });

		m_driving = true;
		m_inputs.lineState = LineState::resumeK(m_device.speed());
		m_inputs.rxActive = true;
		m_inputs.rxValid = false;
		m_inputs.rxError = false;
		step();

		for (size_t i = 0; i < bytes.size(); ++i)
		{
			m_inputs.rxValid = true;
			m_inputs.rxData = bytes[i];
			m_inputs.rxError = rxErrorAt && *rxErrorAt == i;
			step();
		}

		m_driving = false;
		run(m_config.interpacketGap);
	}

	std::vector<uint8_t> SimuPhy::receive(size_t timeoutCycles)
	{
		if (timeoutCycles == 0)
			timeoutCycles = m_config.receiveTimeout;
		if (timeoutCycles == 0)
			timeoutCycles = m_device.timing().longestTurnaround() + 16;

		// longest data packet: PID, 1024 bytes payload, CRC
		const size_t packetLimit = timeoutCycles + 1024 + 3 + 1;

		for (size_t i = 0; m_received.empty(); ++i)
		{
			if (i >= timeoutCycles && m_transmitting.empty())
				return {};
			USBLINK_ASSERT_HINT(i < packetLimit, "device transmits longer than any valid packet");
			step();
		}

		std::vector<uint8_t> packet = std::move(m_received.front());
		m_received.pop_front();
		return packet;
	}

	void SimuPhy::driveLineState(uint8_t lineState, size_t cycles)
	{
		m_lineOverride = lineState;
		run(cycles);
	}
}
