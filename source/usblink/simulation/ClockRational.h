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

#include <boost/rational.hpp>

#include <cstdint>
#include <cstddef>

namespace usblink::sim {
	using ClockRational = boost::rational<std::uint64_t>;

	inline size_t floor(const ClockRational &v) { return v.numerator() / v.denominator(); }
	inline size_t ceil(const ClockRational &v) { return (v.numerator() + v.denominator()-1) / v.denominator(); }

	inline double toDouble(const ClockRational &v) { return (double) v.numerator() / v.denominator(); }

	/// Clock period in picoseconds, the time unit of all waveform output.
	inline ClockRational periodPicoseconds(const ClockRational &frequency) { return ClockRational(1'000'000'000'000ull) / frequency; }
}
