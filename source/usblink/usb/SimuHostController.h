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

#include "SimuPhy.h"
#include "Descriptor.h"
#include "EndpointAddress.h"
#include "Pid.h"
#include "Setup.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace usblink::usb
{
	/// Outcome of a single IN transaction.
	struct InTransaction
	{
		/// handshake or data PID of the response, empty on timeout
		std::optional<Pid> pid;
		std::vector<uint8_t> data;
	};

	/**
	 * @brief Host side of the simulated bus.
	 * @details Issues tokens, data and handshakes through a SimuPhy and checks every response
	 * for PID, CRC and data toggle errors. Transfers retry on NAK. Protocol violations by the
	 * device raise an InternalError.
	 */
	class SimuHostController
	{
	public:
		SimuHostController(SimuPhy &phy, const Descriptor &descriptor);

		uint8_t functionAddress() const { return m_functionAddress; }
		void functionAddress(uint8_t address) { m_functionAddress = address; }
		/// NAKs tolerated per transaction before giving up.
		void nakLimit(size_t limit) { m_nakLimit = limit; }

		SimuPhy &phy() { return m_phy; }

		void sendToken(Pid pid, uint16_t data);
		void sendToken(Pid pid, uint8_t address, uint8_t endPoint);
		void sendSof(uint16_t frame);
		void sendData(Pid pid, std::span<const uint8_t> data);
		void sendHandshake(Pid pid);
		std::optional<Pid> receivePid(size_t timeoutCycles = 0);

		/// One IN token and the response, acknowledged unless the endpoint is isochronous.
		InTransaction transactionIn(uint8_t endPoint, bool acknowledge = true);
		/// One OUT or SETUP token with a data packet, returns the handshake.
		std::optional<Pid> transactionOut(uint8_t endPoint, std::span<const uint8_t> data, Pid dataPid = Pid::data0, Pid tokenPid = Pid::out);
		std::optional<Pid> ping(uint8_t endPoint);

		/// Reads one packet, retrying on NAK. Returns nothing on STALL or timeout.
		std::optional<std::vector<uint8_t>> transferIn(uint8_t endPoint);
		/// Reads packets until a short packet arrives or length bytes are collected.
		std::vector<uint8_t> transferInBatch(uint8_t endPoint, size_t length);
		/// Writes packets of at most the max packet size, retrying on NAK. Returns the bytes acknowledged.
		size_t transferOutBatch(uint8_t endPoint, std::span<const uint8_t> data);
		bool transferSetup(const SetupPacket &packet);

		bool controlTransferOut(const SetupPacket &packet, std::span<const uint8_t> data = {});
		/// Returns nothing if the device stalled the request.
		std::optional<std::vector<uint8_t>> controlTransferIn(const SetupPacket &packet);
		bool controlSetAddress(uint8_t newAddress);
		bool controlSetConfiguration(uint8_t configuration);

		std::vector<uint8_t> readDescriptor(uint8_t type, uint8_t index, uint16_t length);

		/**
		 * @brief Holds SE0 until the device detected the reset.
		 * @details With speed high the host answers a device chirp with three K/J chirp pairs.
		 * Returns the speed the device settled on.
		 */
		UsbSpeed busReset(UsbSpeed speed = UsbSpeed::full);

		/// Device discovery as performed by common operating systems, ending in the configured state.
		void enumerate(uint8_t address = 5, uint8_t configuration = 1);

		Pid nextDataPidOut(uint8_t endPoint) const { return m_nextDataPidOut[endPoint]; }
		Pid nextDataPidIn(uint8_t endPoint) const { return m_nextDataPidIn[endPoint]; }
		/// Back to DATA0 on all endpoints, as after a configuration change.
		void resetDataToggles();

		static std::vector<uint8_t> tokenPacket(Pid pid, uint16_t data);
		static std::vector<uint8_t> dataPacket(Pid pid, std::span<const uint8_t> data);

	protected:
		void checkPacketBitErrors(std::span<const uint8_t> packet) const;
		void checkDescriptor(uint8_t type, uint8_t index, std::span<const uint8_t> data) const;
		size_t maxPacketSize(uint8_t endPoint, EndpointDirection direction) const;
		static Pid toggle(Pid pid) { return pid == Pid::data0 ? Pid::data1 : Pid::data0; }

	private:
		SimuPhy &m_phy;
		Descriptor m_descriptor;
		uint8_t m_functionAddress = 0;
		uint8_t m_maxPacketLength = 64;
		size_t m_nakLimit = 64;
		std::array<Pid, 16> m_nextDataPidOut;
		std::array<Pid, 16> m_nextDataPidIn;
	};
}
