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
#include "DataPacket.h"

namespace usblink::usb
{
	DataCrcUnit::State DataCrcUnit::initialState()
	{
		State state{ .crc = { .params = CrcParams::init(CrcWellKnownParams::CRC_16_USB) } };
		state.crc.init();
		return state;
	}

	DataCrcUnit::DataCrcUnit() :
		m_state(initialState())
	{
	}

	void DataCrcUnit::evaluate(bool start, const UtmiInputs &utmi, bool txStrobe, uint8_t txData)
	{
		const State &cur = m_state.current();
		State next = cur;

		if (start)
		{
			next.crc.init();
			next.pendingCount = 0;
		}
		else if (utmi.rxValid)
		{
			if (cur.pendingCount == 2)
			{
				next.crc.update(cur.pending[0]);
				next.pending[0] = cur.pending[1];
				next.pending[1] = utmi.rxData;
			}
			else
			{
				next.pending[cur.pendingCount] = utmi.rxData;
				next.pendingCount = cur.pendingCount + 1;
			}
		}
		else if (txStrobe)
		{
			next.crc.update(txData);
		}

		m_state = next;
	}

	void DataPacketReceiver::evaluate(const UtmiInputs &utmi, DataCrcInterface &crc, InterpacketTimerInterface &timer)
	{
		const State &cur = m_state.current();
		State next = cur;
		next.stream.next = false;
		next.packetComplete = false;
		next.crcMismatch = false;

		if (cur.awaitingResponse && (timer.txAllowed || utmi.rxActive))
			next.awaitingResponse = false;

		auto abortPacket = [&]() {
			next.stream.valid = false;
			next.crcMismatch = true;
			next.phase = Phase::idle;
		};

		if (utmi.rxError && cur.phase != Phase::idle && cur.phase != Phase::irrelevant)
			next.rxError = true;

		switch (cur.phase)
		{
			case Phase::idle:
				if (utmi.rxActive)
					next.phase = Phase::awaitPid;
				break;

			case Phase::awaitPid:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				else if (utmi.rxValid)
				{
					uint8_t pid = utmi.rxData & 0xF;
					if (pidCheckValid(utmi.rxData) && isDataPid(pid))
					{
						next.pid = pid;
						next.length = 0;
						next.rxError = utmi.rxError;
						next.stream.valid = true;
						next.phase = Phase::firstByte;
						crc.start = true;
					}
					else
						next.phase = Phase::irrelevant;
				}
				break;

			case Phase::firstByte:
				if (!utmi.rxActive)
					abortPacket();
				else if (utmi.rxValid)
				{
					next.buffer[0] = utmi.rxData;
					next.phase = Phase::secondByte;
				}
				break;

			case Phase::secondByte:
				if (!utmi.rxActive)
					abortPacket();
				else if (utmi.rxValid)
				{
					next.buffer[1] = utmi.rxData;
					next.phase = Phase::payload;
				}
				break;

			case Phase::payload:
				if (!utmi.rxActive)
				{
					uint16_t received = cur.buffer[0] | uint16_t(cur.buffer[1]) << 8;
					if (received == crc.crc && !cur.rxError)
					{
						next.stream.valid = false;
						next.packetComplete = true;
						next.awaitingResponse = true;
						next.phase = Phase::idle;
						timer.start = true;
					}
					else
						abortPacket();
				}
				else if (utmi.rxValid)
				{
					next.stream.next = true;
					next.stream.payload = cur.buffer[0];
					next.buffer[0] = cur.buffer[1];
					next.buffer[1] = utmi.rxData;
					next.length = cur.length + 1;
				}
				break;

			case Phase::irrelevant:
				if (!utmi.rxActive)
					next.phase = Phase::idle;
				break;
		}

		m_state = next;
	}

	DataPacketGenerator::Transmit DataPacketGenerator::transmit(const ByteStream &stream, uint16_t crc, bool txReady) const
	{
		const State &cur = m_state.current();

		Transmit tx;
		switch (cur.phase)
		{
			case Phase::idle:
				break;
			case Phase::sendPid:
				tx.valid = true;
				tx.data = cur.pid;
				break;
			case Phase::sendPayload:
				tx.valid = stream.valid;
				tx.data = stream.payload;
				tx.payloadStrobe = stream.valid && txReady;
				break;
			case Phase::sendCrcFirst:
				tx.valid = true;
				tx.data = uint8_t(crc);
				break;
			case Phase::sendCrcSecond:
				tx.valid = true;
				tx.data = cur.crcHigh;
				break;
		}
		return tx;
	}

	void DataPacketGenerator::evaluate(const ByteStream &stream, uint8_t dataPid, bool txReady, DataCrcInterface &crc, InterpacketTimerInterface &timer)
	{
		const State &cur = m_state.current();
		State next = cur;

		switch (cur.phase)
		{
			case Phase::idle:
				if (stream.valid && (stream.first || stream.last))
				{
					next.pid = pidByte(dataPidFromSelector(dataPid));
					next.zeroLength = !stream.first;
					next.phase = Phase::sendPid;
				}
				break;

			case Phase::sendPid:
				if (txReady)
				{
					crc.start = true;
					next.phase = cur.zeroLength ? Phase::sendCrcFirst : Phase::sendPayload;
				}
				break;

			case Phase::sendPayload:
				if (stream.valid && txReady && stream.last)
					next.phase = Phase::sendCrcFirst;
				break;

			case Phase::sendCrcFirst:
				if (txReady)
				{
					next.crcHigh = uint8_t(crc.crc >> 8);
					next.phase = Phase::sendCrcSecond;
				}
				break;

			case Phase::sendCrcSecond:
				if (txReady)
				{
					next.phase = Phase::idle;
					timer.start = true;
				}
				break;
		}

		m_state = next;
	}
}
