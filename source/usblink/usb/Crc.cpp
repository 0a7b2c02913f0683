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
#include "Crc.h"

#include "../utils/Exceptions.h"
#include "../utils/Range.h"

usblink::usb::CrcParams usblink::usb::CrcParams::init(CrcWellKnownParams standard)
{
	switch(standard)
	{
	case CrcWellKnownParams::CRC_5_USB:
		return {
			.width = 5,
			.polynomial = 0b00101,
			.initialRemainder = 0b11111,
			.reverseData = true,
			.reverseCrc = true,
			.xorOut = 0b11111,
		};
	case CrcWellKnownParams::CRC_16_USB:
		return {
			.width = 16,
			.polynomial = 0x8005,
			.initialRemainder = 0xFFFF,
			.reverseData = true,
			.reverseCrc = true,
			.xorOut = 0xFFFF,
		};
	}
	USBLINK_ASSERT_HINT(false, "unknown crc parameter set");
}

void usblink::usb::CrcState::init()
{
	remainder = params.initialRemainder;
}

void usblink::usb::CrcState::update(uint64_t data, size_t bits)
{
	const uint32_t topBit = 1u << (params.width - 1);
	const uint32_t mask = (topBit << 1) - 1;

	for (auto i : utils::Range(bits))
	{
		size_t bitIdx = params.reverseData ? i : bits - 1 - i;
		bool feedback = ((remainder & topBit) != 0) != (((data >> bitIdx) & 1) != 0);
		remainder = (remainder << 1) & mask;
		if (feedback)
			remainder ^= params.polynomial;
	}
}

void usblink::usb::CrcState::update(std::span<const uint8_t> bytes)
{
	for (uint8_t byte : bytes)
		update(byte);
}

uint32_t usblink::usb::CrcState::checksum() const
{
	uint32_t res = remainder;

	if (params.reverseCrc)
	{
		uint32_t reversed = 0;
		for (auto i : utils::Range<size_t>(params.width))
			if (res & (1u << i))
				reversed |= 1u << (params.width - 1 - i);
		res = reversed;
	}

	return res ^ params.xorOut;
}

namespace usblink::usb
{
	uint8_t crc5Usb(uint16_t data, size_t bits)
	{
		CrcState state{ .params = CrcParams::init(CrcWellKnownParams::CRC_5_USB) };
		state.init();
		state.update(data, bits);
		return uint8_t(state.checksum());
	}

	bool crc5UsbVerify(uint16_t data)
	{
		return crc5Usb(data, 16) == crc5UsbResidue;
	}

	uint16_t crc5UsbGenerate(uint16_t data)
	{
		data &= 0x7FF;
		return data | (uint16_t(crc5Usb(data, 11)) << 11);
	}

	uint16_t crc16Usb(std::span<const uint8_t> payload)
	{
		CrcState state{ .params = CrcParams::init(CrcWellKnownParams::CRC_16_USB) };
		state.init();
		state.update(payload);
		return uint16_t(state.checksum());
	}
}
