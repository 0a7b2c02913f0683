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

#include "Crc.h"
#include "Pid.h"
#include "Stream.h"
#include "Utmi.h"
#include "InterpacketTimer.h"
#include "../simulation/Reg.h"

#include <array>
#include <cstdint>

namespace usblink::usb
{
	/// Connection of one consumer to the shared data crc unit.
	struct DataCrcInterface
	{
		/// restart the crc, driven by the consumer
		bool start = false;
		/// crc over all bytes since the last start, excluding the last two received bytes
		uint16_t crc = 0;
	};

	/**
	 * @brief CRC16 shared by receive and transmit path.
	 * @details Received bytes pass a two byte delay line before they are folded in such that
	 * the crc trailer of a packet never enters the computation. Transmitted payload bytes are
	 * folded in directly. A start request wins over a byte arriving in the same cycle.
	 */
	class DataCrcUnit
	{
	public:
		DataCrcUnit();

		uint16_t crc() const { return uint16_t(m_state->crc.checksum()); }

		void evaluate(bool start, const UtmiInputs &utmi, bool txStrobe, uint8_t txData);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			CrcState crc;
			std::array<uint8_t, 2> pending = {};
			uint8_t pendingCount = 0;
		};
		sim::Reg<State> m_state;

		static State initialState();
	};

	/**
	 * @brief Deserializes DATA0/1/2/MDATA packets.
	 * @details The stream lags the receive bus by two bytes so that it ends right before the
	 * crc. After the packet either packetComplete or crcMismatch strobes once.
	 */
	class DataPacketReceiver
	{
	public:
		enum class Phase
		{
			idle,
			awaitPid,
			firstByte,
			secondByte,
			payload,
			irrelevant,
		};

		const UsbOutStream &stream() const { return m_state->stream; }
		bool packetComplete() const { return m_state->packetComplete; }
		bool crcMismatch() const { return m_state->crcMismatch; }
		/// Selector of the last data PID, DATA0 = 0 to MDATA = 3.
		uint8_t pidSelector() const { return dataPidSelector(m_state->pid); }
		/// Payload bytes of the current or last packet.
		uint16_t length() const { return m_state->length; }
		bool readyForResponse(const InterpacketTimerInterface &timer) const { return m_state->awaitingResponse && timer.txAllowed; }

		void evaluate(const UtmiInputs &utmi, DataCrcInterface &crc, InterpacketTimerInterface &timer);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			uint8_t pid = uint8_t(Pid::data0);
			std::array<uint8_t, 2> buffer = {};
			bool rxError = false;
			uint16_t length = 0;

			UsbOutStream stream;
			bool packetComplete = false;
			bool crcMismatch = false;
			bool awaitingResponse = false;
		};
		sim::Reg<State> m_state;
	};

	/**
	 * @brief Serializes a framed byte stream into a data packet.
	 * @details A beat with first set starts a packet, a beat with last but without first while
	 * idle sends a zero length packet and is consumed without ready. The stream is only ready
	 * while payload is being sent.
	 */
	class DataPacketGenerator
	{
	public:
		enum class Phase
		{
			idle,
			sendPid,
			sendPayload,
			sendCrcFirst,
			sendCrcSecond,
		};

		struct Transmit
		{
			bool valid = false;
			uint8_t data = 0;
			/// a payload byte is accepted by the PHY in this cycle
			bool payloadStrobe = false;
		};

		bool streamReady(bool txReady) const { return m_state->phase == Phase::sendPayload && txReady; }
		Transmit transmit(const ByteStream &stream, uint16_t crc, bool txReady) const;
		bool busy() const { return m_state->phase != Phase::idle; }
		Phase phase() const { return m_state->phase; }

		void evaluate(const ByteStream &stream, uint8_t dataPid, bool txReady, DataCrcInterface &crc, InterpacketTimerInterface &timer);
		void commit() { m_state.commit(); }
		void reset() { m_state.reset(); }

	protected:
		struct State
		{
			Phase phase = Phase::idle;
			uint8_t pid = 0;
			bool zeroLength = false;
			uint8_t crcHigh = 0;
		};
		sim::Reg<State> m_state;
	};
}
