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

#include <boost/hana/adapt_struct.hpp>

#include <cstdint>

namespace usblink::usb
{
	enum class UsbSpeed : uint8_t
	{
		high,
		full,
		low,
	};

	/**
	 * @brief UTMI line state encoding.
	 * @details J and K are given for full speed signalling, which is also what the PHY reports
	 * during high speed chirps. Low speed swaps J and K.
	 */
	struct LineState
	{
		static constexpr uint8_t SE0 = 0b00;
		static constexpr uint8_t J = 0b01;
		static constexpr uint8_t K = 0b10;
		static constexpr uint8_t SE1 = 0b11;

		static constexpr uint8_t idleJ(UsbSpeed speed) { return speed == UsbSpeed::low ? K : J; }
		static constexpr uint8_t resumeK(UsbSpeed speed) { return speed == UsbSpeed::low ? J : K; }
	};

	enum class OpMode : uint8_t
	{
		normal				= 0b00,
		nonDriving			= 0b01,
		disableBitStuffing	= 0b10,
		noSyncEop			= 0b11,
	};

	enum class XcvrSelect : uint8_t
	{
		highSpeed			= 0b00,
		fullSpeed			= 0b01,
		lowSpeed			= 0b10,
		fullSpeedForLowSpeed= 0b11,
	};

	/// Signals driven by the PHY towards the link layer.
	struct UtmiInputs
	{
		uint8_t rxData = 0;
		bool rxValid = false;
		bool rxActive = false;
		bool rxError = false;
		uint8_t lineState = LineState::J;
		bool vbusValid = true;
		bool txReady = true;
	};

	/// Signals driven by the link layer towards the PHY.
	struct UtmiOutputs
	{
		uint8_t txData = 0;
		bool txValid = false;

		OpMode opMode = OpMode::normal;
		XcvrSelect xcvrSelect = XcvrSelect::fullSpeed;
		/// true selects the full/low speed terminations including the D+ pull up
		bool termSelect = true;
		/// active low suspend
		bool suspendM = true;
		bool dpPulldown = false;
		bool dmPulldown = false;
	};
}

BOOST_HANA_ADAPT_STRUCT(usblink::usb::UtmiInputs, rxData, rxValid, rxActive, rxError, lineState, vbusValid, txReady);
BOOST_HANA_ADAPT_STRUCT(usblink::usb::UtmiOutputs, txData, txValid, opMode, xcvrSelect, termSelect, suspendM, dpPulldown, dmPulldown);
