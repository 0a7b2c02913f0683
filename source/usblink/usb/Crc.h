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

#include <cstdint>
#include <span>

namespace usblink::usb
{
	enum class CrcWellKnownParams
	{
		CRC_5_USB,
		CRC_16_USB,
	};

	/// Parameters in the usual Rocksoft notation, polynomial without its leading term.
	struct CrcParams
	{
		uint8_t width;
		uint32_t polynomial; // generator polynomial
		uint32_t initialRemainder; // value of remainder before data added
		bool reverseData; // bit reverse in data
		bool reverseCrc; // bit reverse out checksum
		uint32_t xorOut; // bit flip out checksum

		static CrcParams init(CrcWellKnownParams standard);
	};

	/**
	 * @brief Running crc computation.
	 * @details The state is a plain value, copying it seeds a second computation with the
	 * progress of the first.
	 */
	struct CrcState
	{
		CrcParams params;
		uint32_t remainder = 0;

		void init();
		/// Feeds the lowest `bits` bits of data, in wire order.
		void update(uint64_t data, size_t bits);
		void update(uint8_t byte) { update(byte, 8); }
		void update(std::span<const uint8_t> bytes);
		uint32_t checksum() const;
	};

	/// Residue of crc5 over 11 data bits followed by their crc.
	constexpr uint8_t crc5UsbResidue = 0x19;
	/// Residue of crc16 over a payload followed by its crc.
	constexpr uint16_t crc16UsbResidue = 0x4FFE;

	uint8_t crc5Usb(uint16_t data, size_t bits);
	bool crc5UsbVerify(uint16_t data);
	/// Appends the crc5 to the 11 low bits of data.
	uint16_t crc5UsbGenerate(uint16_t data);

	uint16_t crc16Usb(std::span<const uint8_t> payload);
}
