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

#include <usblink/usb/BusTiming.h>
#include <usblink/usb/InterpacketTimer.h>
#include <usblink/usb/TokenDetector.h>
#include <usblink/usb/Handshake.h>
#include <usblink/usb/DataPacket.h>
#include <usblink/usb/SimuHostController.h>

using namespace boost::unit_test;
using namespace usblink;
using namespace usblink::usb;

namespace
{
	/// UTMI receive side for one packet: a cycle of rx_active without data, the bytes, then idle cycles.
	std::vector<UtmiInputs> packetCycles(std::vector<uint8_t> packet, std::optional<size_t> rxErrorAt = {}, size_t gap = 4)
	{
		std::vector<UtmiInputs> cycles;
		cycles.push_back(UtmiInputs{ .rxActive = true, .lineState = LineState::K });
		for (size_t i = 0; i < packet.size(); ++i)
			cycles.push_back(UtmiInputs{
				.rxData = packet[i],
				.rxValid = true,
				.rxActive = true,
				.rxError = rxErrorAt == i,
				.lineState = LineState::K,
			});
		for (size_t i = 0; i < gap; ++i)
			cycles.push_back(UtmiInputs{});
		return cycles;
	}

	struct TokenCapture
	{
		std::optional<TokenDetectorInterface> token;
		std::optional<uint16_t> frame;
		size_t timerStarts = 0;
	};

	TokenCapture detectToken(TokenDetector &detector, std::vector<uint8_t> packet, uint8_t deviceAddress = 0)
	{
		BusTiming timing = BusTiming::forClock(60'000'000ull);
		InterpacketTimer timer(timing);

		TokenCapture capture;
		for (const UtmiInputs &utmi : packetCycles(packet))
		{
			InterpacketTimerInterface timerIo = timer.outputs(UsbSpeed::full);
			detector.evaluate(utmi, deviceAddress, timerIo);
			if (timerIo.start)
			{
				capture.timerStarts++;
				timer.start(TimerRequester::tokenDetector);
			}
			timer.evaluate();
			detector.commit();
			timer.commit();

			TokenDetectorInterface out = detector.outputs(timer.outputs(UsbSpeed::full));
			if (out.newToken)
				capture.token = out;
			if (out.newFrame)
				capture.frame = out.frame;
		}
		return capture;
	}

	struct ReceivedPacket
	{
		std::vector<uint8_t> payload;
		size_t completions = 0;
		size_t mismatches = 0;
		uint8_t pidSelector = 0;
	};

	ReceivedPacket receivePacket(std::vector<uint8_t> packet, std::optional<size_t> rxErrorAt = {})
	{
		DataPacketReceiver receiver;
		DataCrcUnit crcUnit;

		ReceivedPacket result;
		for (const UtmiInputs &utmi : packetCycles(packet, rxErrorAt))
		{
			DataCrcInterface crcIo{ .crc = crcUnit.crc() };
			InterpacketTimerInterface timerIo;
			receiver.evaluate(utmi, crcIo, timerIo);
			crcUnit.evaluate(crcIo.start, utmi, false, 0);
			receiver.commit();
			crcUnit.commit();

			if (receiver.stream().next)
				result.payload.push_back(receiver.stream().payload);
			if (receiver.packetComplete())
				result.completions++;
			if (receiver.crcMismatch())
				result.mismatches++;
		}
		result.pidSelector = receiver.pidSelector();
		return result;
	}

	/// Bytes accepted by the PHY while the generator sends the payload, txReady drops every third cycle.
	std::vector<uint8_t> transmitPacket(const std::vector<uint8_t> &payload, uint8_t dataPid, bool throttle)
	{
		DataPacketGenerator generator;
		DataCrcUnit crcUnit;

		std::vector<uint8_t> wire;
		size_t position = 0;
		for (size_t cycle = 0; cycle < payload.size() * 3 + 20; ++cycle)
		{
			const bool txReady = !throttle || cycle % 3 != 1;

			ByteStream stream;
			if (payload.empty())
			{
				stream.valid = cycle == 0;
				stream.last = true;
			}
			else if (position < payload.size())
			{
				stream.valid = true;
				stream.first = position == 0;
				stream.last = position + 1 == payload.size();
				stream.payload = payload[position];
			}
			stream.ready = generator.streamReady(txReady);

			DataPacketGenerator::Transmit tx = generator.transmit(stream, crcUnit.crc(), txReady);
			if (tx.valid && txReady)
				wire.push_back(tx.data);

			DataCrcInterface crcIo{ .crc = crcUnit.crc() };
			InterpacketTimerInterface timerIo;
			generator.evaluate(stream, dataPid, txReady, crcIo, timerIo);
			crcUnit.evaluate(crcIo.start, UtmiInputs{}, tx.payloadStrobe, tx.data);
			if (stream.transfer())
				position++;

			generator.commit();
			crcUnit.commit();
		}
		BOOST_TEST(!generator.busy());
		return wire;
	}
}

BOOST_AUTO_TEST_CASE(bus_timing_at_60mhz)
{
	BusTiming timing = BusTiming::forClock(60'000'000ull);

	BOOST_TEST(timing.high.rxToTxMin == 1);
	BOOST_TEST(timing.high.rxToTxMax == 24);
	BOOST_TEST(timing.high.txToRxTimeout == 102);
	BOOST_TEST(timing.full.rxToTxMin == 10);
	BOOST_TEST(timing.full.rxToTxMax == 32);
	BOOST_TEST(timing.full.txToRxTimeout == 90);
	BOOST_TEST(timing.low.rxToTxMin == 80);
	BOOST_TEST(timing.low.rxToTxMax == 260);
	BOOST_TEST(timing.low.txToRxTimeout == 720);

	BOOST_TEST(timing.resetDetect == 150);
	BOOST_TEST(timing.suspendDetect == 180'000);
	BOOST_TEST(timing.deviceChirp == 120'000);
	BOOST_TEST(timing.chirpFilter == 150);
	BOOST_TEST(timing.hostChirpTimeout == 60'000);
	BOOST_TEST(timing.hsSuspendSettle == 12'000);
	BOOST_TEST(timing.longestTurnaround() == 720);
}

BOOST_AUTO_TEST_CASE(bus_timing_rounds_towards_safety)
{
	// 48 MHz: 2 full speed bit times are 8 cycles, 6.5 are 26
	BusTiming timing = BusTiming::forClock(48'000'000ull);
	BOOST_TEST(timing.full.rxToTxMin == 8);
	BOOST_TEST(timing.full.rxToTxMax == 26);

	// 50 MHz: 8.33 cycles round up, 27.08 round down
	timing = BusTiming::forClock(50'000'000ull);
	BOOST_TEST(timing.full.rxToTxMin == 9);
	BOOST_TEST(timing.full.rxToTxMax == 27);
	BOOST_TEST(timing.high.rxToTxMin == 1);
}

BOOST_AUTO_TEST_CASE(interpacket_timer_pulses)
{
	BusTiming timing = BusTiming::forClock(60'000'000ull);
	InterpacketTimer timer(timing);

	for (size_t i = 0; i < 1000; ++i)
	{
		InterpacketTimerInterface out = timer.outputs(UsbSpeed::full);
		BOOST_TEST(!out.txAllowed);
		BOOST_TEST(!out.txTimeout);
		BOOST_TEST(!out.rxTimeout);
		timer.evaluate();
		timer.commit();
	}

	timer.start(TimerRequester::tokenDetector);
	timer.evaluate();
	timer.commit();
	BOOST_TEST(timer.counter() == 0);

	size_t txAllowed = 0, txTimeout = 0, rxTimeout = 0;
	for (size_t cycle = 0; cycle < 1000; ++cycle)
	{
		InterpacketTimerInterface out = timer.outputs(UsbSpeed::full);
		if (out.txAllowed)
		{
			BOOST_TEST(cycle == 10);
			txAllowed++;
		}
		if (out.txTimeout)
		{
			BOOST_TEST(cycle == 32);
			txTimeout++;
		}
		if (out.rxTimeout)
		{
			BOOST_TEST(cycle == 90);
			rxTimeout++;
		}
		timer.evaluate();
		timer.commit();
	}
	BOOST_TEST(txAllowed == 1);
	BOOST_TEST(txTimeout == 1);
	BOOST_TEST(rxTimeout == 1);
}

#ifndef NDEBUG
BOOST_AUTO_TEST_CASE(interpacket_timer_single_requester)
{
	BusTiming timing = BusTiming::forClock(60'000'000ull);
	InterpacketTimer timer(timing);

	timer.start(TimerRequester::dataReceiver);
	timer.start(TimerRequester::dataReceiver);
	BOOST_CHECK_THROW(timer.start(TimerRequester::dataGenerator), utils::InternalError);
}
#endif

BOOST_AUTO_TEST_CASE(token_out_decoded)
{
	TokenDetector detector(false);
	TokenCapture capture = detectToken(detector, { 0xE1, 0x3A, 0x3D });

	BOOST_TEST_REQUIRE(capture.token.has_value());
	BOOST_TEST(capture.token->isOut());
	BOOST_TEST(capture.token->address == 0x3A);
	BOOST_TEST(capture.token->endpoint == 0xA);
	BOOST_TEST(capture.timerStarts == 1);
	BOOST_TEST(!capture.frame);
}

BOOST_AUTO_TEST_CASE(token_address_filter)
{
	TokenDetector filtered(true);
	BOOST_TEST(!detectToken(filtered, { 0xE1, 0x3A, 0x3D }, 5).token);
	BOOST_TEST(detectToken(filtered, { 0xE1, 0x3A, 0x3D }, 0x3A).token.has_value());
}

BOOST_AUTO_TEST_CASE(token_sof_reports_frame)
{
	TokenDetector detector(true);
	TokenCapture capture = detectToken(detector, { 0xA5, 0x3A, 0x3D }, 0);

	BOOST_TEST(!capture.token);
	BOOST_TEST_REQUIRE(capture.frame.has_value());
	BOOST_TEST(*capture.frame == 0x53A);
	BOOST_TEST(capture.timerStarts == 0);
}

BOOST_AUTO_TEST_CASE(token_errors_ignored)
{
	TokenDetector detector(false);

	// crc5 broken
	BOOST_TEST(!detectToken(detector, { 0xE1, 0x3A, 0x3C }).token);
	// pid check nibble broken
	BOOST_TEST(!detectToken(detector, { 0xF1, 0x3A, 0x3D }).token);
	// data pid
	BOOST_TEST(!detectToken(detector, { 0xC3, 0x3A, 0x3D }).token);
	// trailing byte
	BOOST_TEST(!detectToken(detector, { 0xE1, 0x3A, 0x3D, 0x00 }).token);
	// truncated
	BOOST_TEST(!detectToken(detector, { 0xE1, 0x3A }).token);

	BOOST_TEST(detectToken(detector, SimuHostController::tokenPacket(Pid::ping, 0x0085)).token.has_value());
}

BOOST_AUTO_TEST_CASE(token_response_window)
{
	BusTiming timing = BusTiming::forClock(60'000'000ull);
	InterpacketTimer timer(timing);
	TokenDetector detector(true);

	size_t windows = 0;
	size_t cycle = 0, windowCycle = 0, tokenCycle = 0;
	for (const UtmiInputs &utmi : packetCycles(SimuHostController::tokenPacket(Pid::in, 0x0080), {}, 40))
	{
		InterpacketTimerInterface timerIo = timer.outputs(UsbSpeed::full);
		detector.evaluate(utmi, 0, timerIo);
		if (timerIo.start)
			timer.start(TimerRequester::tokenDetector);
		timer.evaluate();
		detector.commit();
		timer.commit();
		cycle++;

		TokenDetectorInterface out = detector.outputs(timer.outputs(UsbSpeed::full));
		if (out.newToken)
			tokenCycle = cycle;
		if (out.readyForResponse)
		{
			windows++;
			windowCycle = cycle;
		}
	}
	BOOST_TEST(windows == 1);
	BOOST_TEST(windowCycle - tokenCycle == timing.full.rxToTxMin);
}

BOOST_AUTO_TEST_CASE(handshake_detection)
{
	auto detect = [](std::vector<uint8_t> packet) {
		HandshakeDetector detector;
		HandshakeExchange seen;
		for (const UtmiInputs &utmi : packetCycles(packet))
		{
			detector.evaluate(utmi);
			detector.commit();
			seen |= detector.detected();
		}
		return seen;
	};

	HandshakeExchange ack = detect({ pidByte(Pid::ack) });
	BOOST_TEST(ack.ack);
	BOOST_TEST(!ack.nak);

	BOOST_TEST(detect({ pidByte(Pid::nak) }).nak);
	BOOST_TEST(detect({ pidByte(Pid::stall) }).stall);
	BOOST_TEST(detect({ pidByte(Pid::nyet) }).nyet);

	BOOST_TEST(!detect({ pidByte(Pid::ack), 0x00 }).any());
	BOOST_TEST(!detect({ 0x02 }).any());
	BOOST_TEST(!detect({ pidByte(Pid::data0) }).any());
}

BOOST_AUTO_TEST_CASE(handshake_generation_priority)
{
	HandshakeGenerator generator;

	generator.evaluate(HandshakeExchange{ .ack = true, .nak = true, .stall = true }, true);
	generator.commit();
	BOOST_TEST(generator.txValid());
	BOOST_TEST(generator.txData() == 0xD2);

	// busy, not latched
	generator.evaluate(HandshakeExchange{ .nak = true }, true);
	generator.commit();
	BOOST_TEST(!generator.txValid());

	generator.evaluate(HandshakeExchange{ .stall = true, .nyet = true }, true);
	generator.commit();
	BOOST_TEST(generator.txData() == 0x1E);

	// held while the PHY is not ready
	generator.evaluate(HandshakeExchange{}, false);
	generator.commit();
	BOOST_TEST(generator.txValid());
	generator.evaluate(HandshakeExchange{}, true);
	generator.commit();
	BOOST_TEST(!generator.busy());
}

BOOST_AUTO_TEST_CASE(data_packet_receive)
{
	const std::vector<uint8_t> payload = { 0x80, 0x06, 0x00, 0x01, 0x00, 0x00, 0x08, 0x00 };
	ReceivedPacket packet = receivePacket(SimuHostController::dataPacket(Pid::data1, payload));

	BOOST_TEST(packet.payload == payload, boost::test_tools::per_element());
	BOOST_TEST(packet.completions == 1);
	BOOST_TEST(packet.mismatches == 0);
	BOOST_TEST(packet.pidSelector == 1);
}

BOOST_AUTO_TEST_CASE(data_packet_receive_zero_length)
{
	ReceivedPacket packet = receivePacket({ pidByte(Pid::data0), 0x00, 0x00 });
	BOOST_TEST(packet.payload.empty());
	BOOST_TEST(packet.completions == 1);
	BOOST_TEST(packet.pidSelector == 0);
}

BOOST_AUTO_TEST_CASE(data_packet_receive_errors)
{
	const std::vector<uint8_t> payload = { 1, 2, 3, 4, 5 };
	const std::vector<uint8_t> good = SimuHostController::dataPacket(Pid::data0, payload);

	std::vector<uint8_t> corrupted = good;
	corrupted.back() ^= 0x40;
	ReceivedPacket packet = receivePacket(corrupted);
	BOOST_TEST(packet.completions == 0);
	BOOST_TEST(packet.mismatches == 1);

	packet = receivePacket(good, 3);
	BOOST_TEST(packet.completions == 0);
	BOOST_TEST(packet.mismatches == 1);

	// ends before the crc is complete
	packet = receivePacket({ pidByte(Pid::data0), 0x00 });
	BOOST_TEST(packet.completions == 0);
	BOOST_TEST(packet.mismatches == 1);

	// handshakes are none of our business
	packet = receivePacket({ pidByte(Pid::ack) });
	BOOST_TEST(packet.completions == 0);
	BOOST_TEST(packet.mismatches == 0);
}

BOOST_DATA_TEST_CASE(data_packet_transmit, data::make({ 0, 1, 2, 7, 64 }) * data::make({ false, true }), length, throttle)
{
	std::vector<uint8_t> payload;
	for (int i = 0; i < length; ++i)
		payload.push_back(uint8_t(0xA0 + i));

	std::vector<uint8_t> wire = transmitPacket(payload, 1, throttle);
	std::vector<uint8_t> expected = SimuHostController::dataPacket(Pid::data1, payload);
	BOOST_TEST(wire == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(data_packet_loopback)
{
	const std::vector<uint8_t> payload = { 0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0xFF };
	ReceivedPacket packet = receivePacket(transmitPacket(payload, 0, false));

	BOOST_TEST(packet.payload == payload, boost::test_tools::per_element());
	BOOST_TEST(packet.completions == 1);
	BOOST_TEST(packet.pidSelector == 0);
}
