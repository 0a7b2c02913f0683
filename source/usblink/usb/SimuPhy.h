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

#include "Device.h"
#include "Pid.h"
#include "Utmi.h"
#include "../simulation/TraceRecorder.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace usblink::utils { class ConfigTree; }

namespace usblink::usb
{
	/// Settings of the simulated PHY.
	struct SimuPhyConfig
	{
		/// VCD file to record into, empty disables recording
		std::string waveformFile;
		/// idle cycles inserted after every packet driven into the device
		size_t interpacketGap = 4;
		/// cycles to wait for a device response, 0 derives it from the bus timing
		size_t receiveTimeout = 0;

		/// Keys are waveform_file, interpacket_gap and receive_timeout.
		void load(const utils::ConfigTree &config);
	};

	/// Renders a packet as seen on the bus, e.g. "IN addr 3 ep 1".
	std::string describePacket(std::span<const uint8_t> packet);

	/**
	 * @brief Testbench PHY connected to the UTMI side of a device.
	 * @details Every call that advances time steps the device one cycle at a time. Packets
	 * received from the host are driven as a burst of rx_valid bytes framed by rx_active,
	 * packets transmitted by the device are collected into a queue from which receive()
	 * takes them.
	 */
	class SimuPhy
	{
	public:
		/// Called before every cycle, e.g. to drive the application side of endpoints.
		using Process = std::function<void(uint64_t cycle)>;

		SimuPhy(Device &device, SimuPhyConfig config = {});
		~SimuPhy();

		Device &device() { return m_device; }
		const SimuPhyConfig &config() const { return m_config; }
		uint64_t cycle() const { return m_device.cycle(); }

		void addProcess(Process process) { m_processes.push_back(std::move(process)); }

		/// Advances the simulation by one cycle.
		void step();
		void run(size_t cycles);
		/// Steps until the condition holds, returns false if maxCycles passed first.
		bool runUntil(const std::function<bool()> &condition, size_t maxCycles);

		/**
		 * @brief Drives one packet from the host into the device followed by the interpacket gap.
		 * @param rxErrorAt index of the byte during which the PHY reports a receive error.
		 */
		void send(std::span<const uint8_t> packet, std::optional<size_t> rxErrorAt = std::nullopt);
		/// Takes the next packet sent by the device, waiting at most timeoutCycles. Returns an empty vector on timeout.
		std::vector<uint8_t> receive(size_t timeoutCycles = 0);
		/// Packets the device sent that have not been received yet.
		size_t pendingPackets() const { return m_received.size(); }
		void clearReceived() { m_received.clear(); }

		/// Holds the line in the given state until releaseLine(), device chirps override it.
		void driveLineState(uint8_t lineState, size_t cycles);
		/// Returns the line to idle for the current device speed.
		void releaseLine() { m_lineOverride.reset(); }
		void vbus(bool valid) { m_inputs.vbusValid = valid; }
		void txReady(bool ready) { m_txReady = ready; }

		/// The device is currently transmitting a chirp K.
		bool deviceChirping() const;

		const UtmiInputs &inputs() const { return m_inputs; }
		void annotate(std::string_view text);
		sim::TraceRecorder *trace() { return m_trace.get(); }

	protected:
		uint8_t idleLineState() const;
		void collect(const UtmiOutputs &outputs);

		Device &m_device;
		SimuPhyConfig m_config;
		std::vector<Process> m_processes;
		std::unique_ptr<sim::TraceRecorder> m_trace;

		UtmiInputs m_inputs;
		std::optional<uint8_t> m_lineOverride;
		bool m_driving = false;
		bool m_txReady = true;

		std::vector<uint8_t> m_transmitting;
		std::deque<std::vector<uint8_t>> m_received;
	};
}
