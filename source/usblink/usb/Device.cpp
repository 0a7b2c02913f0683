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
#include "Device.h"
#include "Descriptor.h"
#include "control/ControlEndpoint.h"
#include "control/StandardRequestHandler.h"

#include "../debug/DebugInterface.h"

#include <magic_enum.hpp>

namespace usblink::usb
{
	namespace
	{
		dbg::LogMessage deviceLog(uint64_t cycle, dbg::LogMessage::Source source = dbg::LogMessage::LOG_DEVICE)
		{
			return dbg::LogMessage() << dbg::LogMessage::LOG_INFO << source << dbg::LogMessage::Cycle{ cycle };
		}
	}

	Device::Device(const DeviceConfig &config) :
		m_config((config.validate(), config)),
		m_timing(BusTiming::forClock(config.clockFrequency)),
		m_timer(m_timing),
		m_tokenDetector(config.filterByAddress),
		m_sequencer(m_timing, config.maxSpeed),
		m_reportedSpeed(m_sequencer.currentSpeed())
	{
	}

	Device::~Device() = default;

	ControlEndpoint &Device::addControlEndpoint(const Descriptor &descriptor)
	{
		const DeviceDescriptor *device = descriptor.device();
		USBLINK_DESIGNCHECK_HINT(device, "the descriptor collection lacks a device descriptor");

		ControlEndpoint &ep0 = addEndpoint<ControlEndpoint>(0);
		ep0.addRequestHandler<StandardRequestHandler>(descriptor, device->MaxPacketSize);
		return ep0;
	}

	DeviceState Device::state() const
	{
		return DeviceState{
			.address = m_state->address,
			.configuration = m_state->configuration,
			.speed = m_sequencer.currentSpeed(),
			.busReset = m_sequencer.busReset(),
			.suspended = m_sequencer.suspended(),
			.frame = m_state->frame,
			.microframe = m_state->microframe,
			.sof = m_state->sof,
			.connected = m_connected,
		};
	}

	void Device::finalize()
	{
		for (auto &endpoint : m_endpoints)
			endpoint->finalize();
		m_finalized = true;

		dbg::log(deviceLog(m_cycle, dbg::LogMessage::LOG_CONFIGURATION)
			<< "device with " << uint64_t(m_endpoints.size()) << " endpoints, maximum speed "
			<< magic_enum::enum_name(m_config.maxSpeed) << ", clock " << sim::floor(m_config.clockFrequency) << " Hz");
	}

	EndpointInterface Device::sharedInputs(const UtmiInputs &utmi, const InterpacketTimerInterface &timer) const
	{
		EndpointInterface shared;
		shared.tokenizer = m_tokenDetector.outputs(timer);
		shared.rx = m_receiver.stream();
		shared.rxComplete = m_receiver.packetComplete();
		shared.rxReadyForResponse = m_receiver.readyForResponse(timer);
		shared.rxInvalid = m_receiver.crcMismatch();
		shared.rxPidToggle = m_receiver.pidSelector();
		shared.handshakesIn = m_handshakeDetector.detected();

		shared.speed = m_sequencer.currentSpeed();
		shared.activeAddress = m_state->address;
		shared.activeConfig = m_state->configuration;
		shared.busReset = m_sequencer.busReset();

		shared.tx.ready = m_dataGenerator.streamReady(utmi.txReady && !m_sequencer.busBusy());
		shared.timer = timer;
		shared.dataCrc.crc = m_crc.crc();
		return shared;
	}

	const UtmiOutputs &Device::tick(const UtmiInputs &utmi)
	{
		if (!m_finalized)
			finalize();

		const State &cur = m_state.current();
		State next = cur;
		next.sof = false;

		const UsbSpeed speed = m_sequencer.currentSpeed();
		const InterpacketTimerInterface timer = m_timer.outputs(speed);
		const bool txReady = utmi.txReady && !m_sequencer.busBusy();

		// endpoints
		EndpointInterface shared = sharedInputs(utmi, timer);
		m_multiplexer.fanOut(shared);
		for (auto &endpoint : m_endpoints)
			endpoint->evaluate();
		m_multiplexer.combine(shared);

		// transmit path
		DataCrcInterface generatorCrc{ .crc = m_crc.crc() };
		InterpacketTimerInterface generatorTimer = timer;
		const DataPacketGenerator::Transmit dataTx = m_dataGenerator.transmit(shared.tx, m_crc.crc(), txReady);
		m_handshakeGenerator.evaluate(shared.handshakesOut, txReady);
		m_dataGenerator.evaluate(shared.tx, shared.txPidToggle, txReady, generatorCrc, generatorTimer);

		// receive path
		InterpacketTimerInterface tokenTimer = timer;
		m_tokenDetector.evaluate(utmi, m_state->address, tokenTimer);

		DataCrcInterface receiverCrc{ .crc = m_crc.crc() };
		InterpacketTimerInterface receiverTimer = timer;
		m_receiver.evaluate(utmi, receiverCrc, receiverTimer);
		m_handshakeDetector.evaluate(utmi);
		m_sequencer.evaluate(utmi);

		// PHY
		const ResetSequencer::Controls controls = m_sequencer.controls();
		UtmiOutputs out;
		out.opMode = controls.opMode;
		out.xcvrSelect = controls.xcvrSelect;
		out.termSelect = controls.termSelect;
		out.suspendM = !m_sequencer.suspended();

		bool payloadStrobe = false;
		if (controls.txValid)
		{
			out.txValid = true;
			out.txData = controls.txData;
		}
		else if (m_handshakeGenerator.txValid())
		{
			out.txValid = true;
			out.txData = m_handshakeGenerator.txData();
		}
		else
		{
			out.txValid = dataTx.valid;
			out.txData = dataTx.data;
			payloadStrobe = dataTx.payloadStrobe;
		}

		if (!m_connected)
		{
			out.opMode = OpMode::nonDriving;
			out.termSelect = false;
			out.txValid = false;
		}
		m_outputs = out;

		// shared resources
		m_crc.evaluate(receiverCrc.start || generatorCrc.start || shared.dataCrc.start, utmi, payloadStrobe, out.txData);

		if (tokenTimer.start)
			m_timer.start(TimerRequester::tokenDetector);
		if (receiverTimer.start)
			m_timer.start(TimerRequester::dataReceiver);
		if (generatorTimer.start)
			m_timer.start(TimerRequester::dataGenerator);
		if (shared.timer.start)
			m_timer.start(TimerRequester::endpoints);
		m_timer.evaluate();

		// device registers
		if (m_sequencer.busReset())
		{
			next.address = 0;
			next.configuration = 0;
		}
		else
		{
			if (shared.addressChanged)
				next.address = shared.newAddress;
			if (shared.configChanged)
				next.configuration = shared.newConfig;
		}

		if (shared.tokenizer.newFrame)
		{
			next.sof = true;
			if (shared.tokenizer.frame == cur.frame)
				next.microframe = (cur.microframe + 1) & 0x7;
			else
			{
				next.frame = shared.tokenizer.frame;
				next.microframe = 0;
			}
		}
		m_state = next;

		reportChanges(shared);

		// clock edge
		m_timer.commit();
		m_tokenDetector.commit();
		m_receiver.commit();
		m_handshakeDetector.commit();
		m_handshakeGenerator.commit();
		m_dataGenerator.commit();
		m_crc.commit();
		m_sequencer.commit();
		for (auto &endpoint : m_endpoints)
			endpoint->commit();
		m_multiplexer.commit();
		m_state.commit();
		m_cycle++;

		return m_outputs;
	}

	void Device::reportChanges(const EndpointInterface &shared)
	{
		if (m_sequencer.busReset() && !m_reportedReset)
			dbg::log(deviceLog(m_cycle, dbg::LogMessage::LOG_RESET) << "bus reset");
		m_reportedReset = m_sequencer.busReset();

		if (m_sequencer.currentSpeed() != m_reportedSpeed)
		{
			m_reportedSpeed = m_sequencer.currentSpeed();
			dbg::log(deviceLog(m_cycle, dbg::LogMessage::LOG_RESET) << "bus speed is now " << magic_enum::enum_name(m_reportedSpeed));
		}

		if (m_sequencer.suspended() != m_reportedSuspend)
		{
			m_reportedSuspend = m_sequencer.suspended();
			dbg::log(deviceLog(m_cycle, dbg::LogMessage::LOG_RESET) << (m_reportedSuspend ? "suspended" : "resumed"));
		}

		if (!m_sequencer.busReset() && shared.addressChanged)
			dbg::log(deviceLog(m_cycle) << "address set to " << shared.newAddress);
		if (!m_sequencer.busReset() && shared.configChanged)
			dbg::log(deviceLog(m_cycle) << "configuration set to " << shared.newConfig);
	}
}
