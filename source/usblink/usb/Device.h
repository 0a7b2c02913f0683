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
#include "DeviceConfig.h"
#include "InterpacketTimer.h"
#include "TokenDetector.h"
#include "Handshake.h"
#include "DataPacket.h"
#include "ResetSequencer.h"
#include "Endpoint.h"
#include "EndpointMultiplexer.h"
#include "../simulation/Reg.h"
#include "../utils/Exceptions.h"

#include <boost/hana/adapt_struct.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <vector>

namespace usblink::usb
{
	class ControlEndpoint;
	class Descriptor;

	/// Registered device level state, recorded once per cycle into waveforms.
	struct DeviceState
	{
		uint8_t address = 0;
		uint8_t configuration = 0;
		UsbSpeed speed = UsbSpeed::full;
		bool busReset = false;
		bool suspended = false;
		uint16_t frame = 0;
		uint8_t microframe = 0;
		bool sof = false;
		bool connected = true;
	};

	/**
	 * @brief A USB 2.0 device link layer on top of a UTMI PHY.
	 * @details The device owns the packet level components, the reset sequencer and all
	 * endpoints. tick() advances every component by one clock cycle: it evaluates the
	 * outputs for the given PHY inputs and latches the next state of every register. The
	 * returned PHY outputs belong to the cycle just evaluated.
	 */
	class Device
	{
	public:
		Device(const DeviceConfig &config = {});
		~Device();

		Device(const Device&) = delete;
		Device &operator=(const Device&) = delete;

		/// Adds an endpoint handler, endpoint numbers and directions may only be used once.
		template<std::derived_from<Endpoint> T, typename... Args>
		T &addEndpoint(Args&&... args);

		/// Adds endpoint 0 serving the standard requests from the descriptor collection.
		ControlEndpoint &addControlEndpoint(const Descriptor &descriptor);

		/// Soft connect. While disconnected the PHY does not drive the bus and the pull up is off.
		void connect(bool connected = true) { m_connected = connected; }

		const UtmiOutputs &tick(const UtmiInputs &utmi);
		const UtmiOutputs &outputs() const { return m_outputs; }

		DeviceState state() const;
		uint64_t cycle() const { return m_cycle; }

		uint8_t address() const { return m_state->address; }
		uint8_t configuration() const { return m_state->configuration; }
		UsbSpeed speed() const { return m_sequencer.currentSpeed(); }
		uint16_t frame() const { return m_state->frame; }
		uint8_t microframe() const { return m_state->microframe; }

		const DeviceConfig &config() const { return m_config; }
		const BusTiming &timing() const { return m_timing; }
		const ResetSequencer &resetSequencer() const { return m_sequencer; }
		const EndpointMultiplexer &multiplexer() const { return m_multiplexer; }
		const std::vector<std::unique_ptr<Endpoint>> &endpoints() const { return m_endpoints; }

	protected:
		struct State
		{
			uint8_t address = 0;
			uint8_t configuration = 0;
			uint16_t frame = 0;
			uint8_t microframe = 0;
			bool sof = false;
		};

		void finalize();
		EndpointInterface sharedInputs(const UtmiInputs &utmi, const InterpacketTimerInterface &timer) const;
		void reportChanges(const EndpointInterface &shared);

		DeviceConfig m_config;
		BusTiming m_timing;

		InterpacketTimer m_timer;
		TokenDetector m_tokenDetector;
		DataPacketReceiver m_receiver;
		HandshakeDetector m_handshakeDetector;
		HandshakeGenerator m_handshakeGenerator;
		DataPacketGenerator m_dataGenerator;
		DataCrcUnit m_crc;
		ResetSequencer m_sequencer;

		std::vector<std::unique_ptr<Endpoint>> m_endpoints;
		EndpointMultiplexer m_multiplexer;

		sim::Reg<State> m_state;
		UtmiOutputs m_outputs;
		bool m_connected = true;
		bool m_finalized = false;
		uint64_t m_cycle = 0;

		UsbSpeed m_reportedSpeed;
		bool m_reportedSuspend = false;
		bool m_reportedReset = false;
	};

	template<std::derived_from<Endpoint> T, typename... Args>
	T &Device::addEndpoint(Args&&... args)
	{
		USBLINK_DESIGNCHECK_HINT(!m_finalized, "endpoints must be added before the first cycle");

		auto endpoint = std::make_unique<T>(std::forward<Args>(args)...);
		const EndpointAddress &address = endpoint->address();
		USBLINK_DESIGNCHECK_HINT(address.number < 16, "USB 2.0 devices have at most 16 endpoint numbers");
		for (const auto &existing : m_endpoints)
			USBLINK_DESIGNCHECK_HINT(!existing->address().overlaps(address),
				"endpoint " + std::to_string(address.number) + " is already in use");

		T &ref = *endpoint;
		m_multiplexer.add(ref.interface());
		m_endpoints.push_back(std::move(endpoint));
		return ref;
	}
}

BOOST_HANA_ADAPT_STRUCT(usblink::usb::DeviceState, address, configuration, speed, busReset, suspended, frame, microframe, sof, connected);
