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
#include "VCDWriter.h"
#include "../../utils/Range.h"
#include "../../utils/Exceptions.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>

usblink::sim::VCDWriter::VCDWriter(std::string filename) :
	m_FileName(filename)
{
	auto parentPath = std::filesystem::path(filename).parent_path();
	if (!parentPath.empty())
		std::filesystem::create_directories(parentPath);

	m_File.open(m_FileName.c_str(), std::ofstream::binary);
	if (!m_File)
		throw std::runtime_error("Could not open vcd file for writing! " + m_FileName);

	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

	tm now_tb;
	localtime_r(&now, &now_tb);

	m_File
		<< "$date\n" << std::put_time(&now_tb, "%Y-%m-%d %X") << "\n$end\n"
		<< "$version\nUsbLink simulation output\n$end\n"
		<< "$timescale\n1ps\n$end\n";
}

usblink::sim::VCDWriter::Scope usblink::sim::VCDWriter::beginModule(std::string_view name)
{
	USBLINK_ASSERT(!name.empty());
	USBLINK_ASSERT(!m_EndDefinitions);
	m_File << "$scope module " << name << " $end\n";

	return Scope([this]() {
		m_File << "$upscope $end\n";
	});
}

void usblink::sim::VCDWriter::declareWire(size_t width, std::string_view code, std::string_view label)
{
	USBLINK_ASSERT(!m_EndDefinitions);
	m_File << "$var wire " << width << " " << code << " " << label << " $end\n";
}

void usblink::sim::VCDWriter::declareString(std::string_view code, std::string_view label)
{
	USBLINK_ASSERT(!m_EndDefinitions);
	m_File << "$var string 0 " << code << " " << label << " $end\n";
}

void usblink::sim::VCDWriter::endDefinitions()
{
	USBLINK_ASSERT(!m_EndDefinitions);
	m_File << "$enddefinitions $end\n";
	m_EndDefinitions = true;
}

usblink::sim::VCDWriter::Scope usblink::sim::VCDWriter::beginDumpVars()
{
	USBLINK_ASSERT(m_EndDefinitions);
	m_File << "$dumpvars\n";

	return Scope([this]() {
		m_File << "$end\n";
	});
}

void usblink::sim::VCDWriter::writeState(std::string_view code, size_t size, uint64_t defined, uint64_t value)
{
	USBLINK_ASSERT(m_EndDefinitions);

	m_File << 'b';
	for(auto i : utils::Range(size)) {
		auto bitIdx = size - 1 - i;
		bool def = (defined >> bitIdx) & 1;
		bool val = (value >> bitIdx) & 1;
		if(!def)
			m_File << 'X';
		else if(val)
			m_File << '1';
		else
			m_File << '0';
	}
	m_File << ' ' << code << '\n';
}

void usblink::sim::VCDWriter::writeString(std::string_view code, std::string_view text)
{
	USBLINK_ASSERT(m_EndDefinitions);

	if (text.empty())
		text = " ";

	m_File << 's';
	for (auto c : text)
		if (c == ' ')
			m_File << "\\x20";
		else
			m_File << c;

	m_File << ' ' << code << '\n';
}

void usblink::sim::VCDWriter::writeBitState(std::string_view code, bool defined, bool value)
{
	USBLINK_ASSERT(m_EndDefinitions);

	if(!defined)
		m_File << 'X';
	else if(value)
		m_File << '1';
	else
		m_File << '0';

	m_File << code << '\n';
}

void usblink::sim::VCDWriter::writeTime(size_t time)
{
	USBLINK_ASSERT(m_EndDefinitions);
	m_File << '#' << time << '\n';
}
