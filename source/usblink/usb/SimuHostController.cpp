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
#include "SimuHostController.h"

#include "Crc.h"
#include "../debug/DebugInterface.h"
#include "../utils/Exceptions.h"

#include <boost/crc.hpp>
#include <magic_enum.hpp>

#include <algorithm>

namespace usblink::usb
{
	namespace
	{
		uint16_t hostCrc16(std::span<const uint8_t> data)
		{
			return boost::crc<16, 0x8005, 0xFFFF, 0xFFFF, true, true>(data.data(), data.size());
		}

		SetupPacket standardRequest(SetupRequest request, bool in, uint16_t value = 0, uint16_t length = 0)
		{
			return SetupPacket{
				.requestType = uint8_t(in ? 0x80 : 0x00),
				.request = uint8_t(request),
				.value = value,
				.length = length,
			};
		}
	}

	SimuHostController::SimuHostController(SimuPhy &phy, const Descriptor &descriptor) :
		m_phy(phy),
		m_descriptor(descriptor)
	{
		if (m_descriptor.device())
			m_maxPacketLength = m_descriptor.device()->MaxPacketSize;

		resetDataToggles();
	}

	void SimuHostController::resetDataToggles()
	{
		m_nextDataPidOut.fill(Pid::data0);
		m_nextDataPidIn.fill(Pid::data0);
	}

	std::vector<uint8_t> SimuHostController::tokenPacket(Pid pid, uint16_t data)
	{
		const uint16_t token = crc5UsbGenerate(data & 0x7FF);
		return { pidByte(pid), uint8_t(token), uint8_t(token >> 8) };
	}

	std::vector<uint8_t> SimuHostController::dataPacket(Pid pid, std::span<const uint8_t> data)
	{
		std::vector<uint8_t> packet;
		packet.reserve(data.size() + 3);
		packet.push_back(pidByte(pid));
		packet.insert(packet.end(), data.begin(), data.end());

		const uint16_t crc = hostCrc16(data);
		packet.push_back(uint8_t(crc));
		packet.push_back(uint8_t(crc >> 8));
		return packet;
	}

	void SimuHostController::sendToken(Pid pid, uint16_t data)
	{
		m_phy.send(tokenPacket(pid, data));
	}

	void SimuHostController::sendToken(Pid pid, uint8_t address, uint8_t endPoint)
	{
		USBLINK_DESIGNCHECK(address < 128);
		USBLINK_DESIGNCHECK(endPoint < 16);
		sendToken(pid, uint16_t(address | endPoint << 7));
	}

	void SimuHostController::sendSof(uint16_t frame)
	{
		sendToken(Pid::sof, uint16_t(frame & 0x7FF));
	}

	void SimuHostController::sendData(Pid pid, std::span<const uint8_t> data)
	{
		m_phy.send(dataPacket(pid, data));
	}

	void SimuHostController::sendHandshake(Pid pid)
	{
		const std::array<uint8_t, 1> packet = { pidByte(pid) };
		m_phy.send(packet);
	}

	void SimuHostController::checkPacketBitErrors(std::span<const uint8_t> packet) const
	{
		USBLINK_ASSERT_HINT(packet.size() == 1 || (packet.size() >= 3 && packet.size() <= 1024 + 3),
			"device sent a packet of invalid length: " + describePacket(packet));
		USBLINK_ASSERT_HINT(pidCheckValid(packet[0]), "device sent a PID with a broken check nibble: " + describePacket(packet));

		const uint8_t pid = packet[0] & 0xF;
		if (packet.size() == 1)
		{
			USBLINK_ASSERT_HINT(isHandshakePid(pid), "single byte packets must be handshakes: " + describePacket(packet));
			return;
		}

		USBLINK_ASSERT_HINT(isDataPid(pid), "devices only send data packets: " + describePacket(packet));
		USBLINK_ASSERT_HINT(hostCrc16(packet.subspan(1)) == crc16UsbResidue, "data packet with broken CRC: " + describePacket(packet));
	}

	std::optional<Pid> SimuHostController::receivePid(size_t timeoutCycles)
	{
		const std::vector<uint8_t> packet = m_phy.receive(timeoutCycles);
		if (packet.empty())
			return std::nullopt;

		checkPacketBitErrors(packet);
		USBLINK_ASSERT_HINT(packet.size() == 1, "expected a handshake but received " + describePacket(packet));
		return Pid(packet[0] & 0xF);
	}

	InTransaction SimuHostController::transactionIn(uint8_t endPoint, bool acknowledge)
	{
		sendToken(Pid::in, m_functionAddress, endPoint);

		const std::vector<uint8_t> packet = m_phy.receive();
		if (packet.empty())
			return {};

		checkPacketBitErrors(packet);
		const Pid pid = Pid(packet[0] & 0xF);
		if (packet.size() == 1)
		{
			USBLINK_ASSERT_HINT(pid == Pid::nak || pid == Pid::stall, "IN answered by " + describePacket(packet));
			return { .pid = pid };
		}

		if (acknowledge)
			sendHandshake(Pid::ack);

		return {
			.pid = pid,
			.data = std::vector<uint8_t>(packet.begin() + 1, packet.end() - 2),
		};
	}

	std::optional<Pid> SimuHostController::transactionOut(uint8_t endPoint, std::span<const uint8_t> data, Pid dataPid, Pid tokenPid)
	{
		sendToken(tokenPid, m_functionAddress, endPoint);
		sendData(dataPid, data);
		return receivePid();
	}

	std::optional<Pid> SimuHostController::ping(uint8_t endPoint)
	{
		sendToken(Pid::ping, m_functionAddress, endPoint);
		return receivePid();
	}

	size_t SimuHostController::maxPacketSize(uint8_t endPoint, EndpointDirection direction) const
	{
		if (endPoint == 0)
			return m_maxPacketLength;

		const uint8_t address = EndpointAddress{ .number = endPoint, .direction = direction }.encode();
		for (const DescriptorEntry &entry : m_descriptor.entries())
		{
			if (entry.type() != EndpointDescriptor::TYPE)
				continue;

			const EndpointDescriptor &ep = entry.decode<EndpointDescriptor>();
			if (ep.Address == address)
				return ep.MaxPacketSize & 0x7FF;
		}
		return m_maxPacketLength;
	}

	std::optional<std::vector<uint8_t>> SimuHostController::transferIn(uint8_t endPoint)
	{
		for (size_t retries = 0; ; ++retries)
		{
			USBLINK_ASSERT_HINT(retries <= m_nakLimit, "endpoint " + std::to_string(endPoint) + " never delivered data");

			InTransaction transaction = transactionIn(endPoint);
			if (!transaction.pid || *transaction.pid == Pid::stall)
				return std::nullopt;
			if (*transaction.pid == Pid::nak)
				continue;

			// a repeated packet after a lost ACK is acknowledged and dropped
			if (*transaction.pid != m_nextDataPidIn[endPoint])
				continue;

			m_nextDataPidIn[endPoint] = toggle(m_nextDataPidIn[endPoint]);
			return std::move(transaction.data);
		}
	}

	std::vector<uint8_t> SimuHostController::transferInBatch(uint8_t endPoint, size_t length)
	{
		const size_t packetSize = maxPacketSize(endPoint, EndpointDirection::in);

		std::vector<uint8_t> ret;
		while (true)
		{
			std::optional<std::vector<uint8_t>> packet = transferIn(endPoint);
			if (!packet)
				return ret;

			ret.insert(ret.end(), packet->begin(), packet->end());
			if (packet->size() != packetSize || ret.size() >= length)
				return ret;
		}
	}

	size_t SimuHostController::transferOutBatch(uint8_t endPoint, std::span<const uint8_t> data)
	{
		USBLINK_DESIGNCHECK(endPoint < 16);
		const size_t packetSize = maxPacketSize(endPoint, EndpointDirection::out);

		size_t sent = 0;
		size_t naks = 0;
		while (sent < data.size())
		{
			std::span<const uint8_t> packet = data.subspan(sent, std::min(data.size() - sent, packetSize));
			std::optional<Pid> pid = transactionOut(endPoint, packet, m_nextDataPidOut[endPoint]);
			if (!pid || *pid == Pid::stall)
				break;

			if (*pid == Pid::ack || *pid == Pid::nyet)
			{
				sent += packet.size();
				m_nextDataPidOut[endPoint] = toggle(m_nextDataPidOut[endPoint]);
			}
			else
			{
				USBLINK_ASSERT_HINT(*pid == Pid::nak, "OUT answered by " + std::string(magic_enum::enum_name(*pid)));
				USBLINK_ASSERT_HINT(++naks <= m_nakLimit, "endpoint " + std::to_string(endPoint) + " never accepted data");
			}
		}
		return sent;
	}

	bool SimuHostController::transferSetup(const SetupPacket &packet)
	{
		const std::array<uint8_t, 8> setup = packet.encode();
		std::optional<Pid> pid = transactionOut(0, setup, Pid::data0, Pid::setup);
		USBLINK_ASSERT_HINT(pid == Pid::ack, "SETUP transactions must always be acknowledged");

		m_nextDataPidIn[0] = Pid::data1;
		m_nextDataPidOut[0] = Pid::data1;
		return true;
	}

	bool SimuHostController::controlTransferOut(const SetupPacket &packet, std::span<const uint8_t> data)
	{
		USBLINK_DESIGNCHECK(data.size() == packet.length);
		transferSetup(packet);

		if (!data.empty() && transferOutBatch(0, data) != data.size())
			return false;

		std::optional<std::vector<uint8_t>> status = transferIn(0);
		if (!status)
			return false;

		USBLINK_ASSERT_HINT(status->empty(), "the status stage is a zero length packet");
		return true;
	}

	std::optional<std::vector<uint8_t>> SimuHostController::controlTransferIn(const SetupPacket &packet)
	{
		transferSetup(packet);

		std::vector<uint8_t> data;
		if (packet.length == 0)
		{
			std::optional<std::vector<uint8_t>> status = transferIn(0);
			if (!status)
				return std::nullopt;
			USBLINK_ASSERT_HINT(status->empty(), "the status stage is a zero length packet");
			return data;
		}

		while (true)
		{
			std::optional<std::vector<uint8_t>> chunk = transferIn(0);
			if (!chunk)
				return std::nullopt;

			data.insert(data.end(), chunk->begin(), chunk->end());
			if (chunk->size() != m_maxPacketLength || data.size() >= packet.length)
				break;
		}
		USBLINK_ASSERT_HINT(data.size() <= packet.length, "device returned more than requested");

		std::optional<Pid> pid = transactionOut(0, {}, Pid::data1);
		if (pid == Pid::stall)
			return std::nullopt;
		USBLINK_ASSERT_HINT(pid == Pid::ack, "the status stage must be acknowledged");
		return data;
	}

	bool SimuHostController::controlSetAddress(uint8_t newAddress)
	{
		m_phy.annotate("set address");

		if (!controlTransferOut(standardRequest(SetupRequest::SET_ADDRESS, false, newAddress)))
			return false;

		m_functionAddress = newAddress;
		return true;
	}

	bool SimuHostController::controlSetConfiguration(uint8_t configuration)
	{
		m_phy.annotate("set configuration");

		if (!controlTransferOut(standardRequest(SetupRequest::SET_CONFIGURATION, false, configuration)))
			return false;

		for (size_t ep = 1; ep < 16; ++ep)
		{
			m_nextDataPidIn[ep] = Pid::data0;
			m_nextDataPidOut[ep] = Pid::data0;
		}
		return true;
	}

	void SimuHostController::checkDescriptor(uint8_t type, uint8_t index, std::span<const uint8_t> data) const
	{
		std::optional<std::vector<uint8_t>> expected = m_descriptor.find(type, index);
		USBLINK_ASSERT_HINT(expected, "device returned a descriptor that does not exist");
		USBLINK_ASSERT_HINT(data.size() <= expected->size(), "descriptor longer than expected");
		USBLINK_ASSERT_HINT(std::equal(data.begin(), data.end(), expected->begin()), "descriptor content differs");
	}

	std::vector<uint8_t> SimuHostController::readDescriptor(uint8_t type, uint8_t index, uint16_t length)
	{
		m_phy.annotate("read descriptor " + std::to_string(type));

		std::optional<std::vector<uint8_t>> data = controlTransferIn(
			standardRequest(SetupRequest::GET_DESCRIPTOR, true, uint16_t(type << 8 | index), length));
		USBLINK_ASSERT_HINT(data, "descriptor request was stalled");
		USBLINK_ASSERT_HINT(data->size() >= 2 && (*data)[1] == type, "descriptor of the wrong type");

		checkDescriptor(type, index, *data);
		return std::move(*data);
	}

	UsbSpeed SimuHostController::busReset(UsbSpeed speed)
	{
		const BusTiming &timing = m_phy.device().timing();
		m_phy.annotate("bus reset");

		m_functionAddress = 0;
		resetDataToggles();

		// a high speed device only recognizes the reset after the squelch timed out
		size_t se0Cycles = timing.resetDetect * 2;
		if (m_phy.device().speed() == UsbSpeed::high)
			se0Cycles += timing.suspendDetect + timing.hsSuspendSettle;
		m_phy.driveLineState(LineState::SE0, se0Cycles);

		const bool chirp = m_phy.runUntil([&] { return m_phy.deviceChirping(); }, 16);
		if (chirp && speed == UsbSpeed::high)
		{
			m_phy.runUntil([&] { return !m_phy.deviceChirping(); }, timing.deviceChirp + 16);
			for (size_t pair = 0; pair < 3; ++pair)
			{
				m_phy.driveLineState(LineState::K, timing.chirpFilter * 2);
				m_phy.driveLineState(LineState::J, timing.chirpFilter * 2);
			}
			m_phy.driveLineState(LineState::SE0, 16);
		}
		else if (chirp)
		{
			// the device gives up on its own while the host stays in SE0
			m_phy.runUntil([&] {
				const ResetSequencer::Phase phase = m_phy.device().resetSequencer().phase();
				return phase == ResetSequencer::Phase::lsFsReset || phase == ResetSequencer::Phase::lsFsNonReset;
			}, timing.deviceChirp + timing.hostChirpTimeout + 64);
		}

		m_phy.releaseLine();
		m_phy.run(16);

		const UsbSpeed negotiated = m_phy.device().speed();
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION << dbg::LogMessage::Cycle{ m_phy.cycle() }
			<< "host reset the bus, device runs at " << magic_enum::enum_name(negotiated) << " speed");
		return negotiated;
	}

	void SimuHostController::enumerate(uint8_t address, uint8_t configuration)
	{
		m_phy.annotate("enumerate");

		// ask for the first 64 bytes at address 0 and abort the transfer with a reset
		transferSetup(standardRequest(SetupRequest::GET_DESCRIPTOR, true, uint16_t(DeviceDescriptor::TYPE << 8), 64));
		std::optional<std::vector<uint8_t>> first = transferIn(0);
		USBLINK_ASSERT_HINT(first, "device descriptor request was stalled");
		USBLINK_ASSERT_HINT(first->size() == std::min<size_t>(sizeof(DeviceDescriptor) + 2, m_maxPacketLength),
			"first packet of the device descriptor has the wrong size");
		checkDescriptor(DeviceDescriptor::TYPE, 0, *first);

		busReset(m_phy.device().speed());

		USBLINK_ASSERT_HINT(controlSetAddress(address), "SET_ADDRESS failed");

		readDescriptor(DeviceDescriptor::TYPE, 0, sizeof(DeviceDescriptor) + 2);
		const std::vector<uint8_t> prefix = readDescriptor(ConfigurationDescriptor::TYPE, 0, 9);
		USBLINK_ASSERT(prefix.size() == 9);

		const uint16_t totalLength = uint16_t(prefix[2] | prefix[3] << 8);
		const std::vector<uint8_t> full = readDescriptor(ConfigurationDescriptor::TYPE, 0, totalLength);
		USBLINK_ASSERT_HINT(full.size() == totalLength, "configuration descriptor is shorter than its total length");

		USBLINK_ASSERT_HINT(controlSetConfiguration(configuration), "SET_CONFIGURATION failed");
	}
}
