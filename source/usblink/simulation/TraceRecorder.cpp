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
#include "TraceRecorder.h"

namespace usblink::sim
{
	TraceRecorder::TraceRecorder(std::string filename, ClockRational clockFrequency) :
		m_filename(filename),
		m_vcd(std::move(filename)),
		m_period(periodPicoseconds(clockFrequency))
	{
		m_annotationCode = nextCode();
	}

	TraceRecorder::~TraceRecorder()
	{
		if (m_vcd)
			m_vcd.flush();
	}

	std::string TraceRecorder::nextCode()
	{
		// printable identifier characters of the VCD format, little endian digits
		std::string code;
		size_t value = m_codeCounter++;
		do {
			code.push_back(char('!' + value % 94));
			value /= 94;
		} while (value != 0);
		return code;
	}

	void TraceRecorder::annotate(std::string_view text)
	{
		if (m_annotationPending)
			m_pendingAnnotation += " | ";
		else
			m_pendingAnnotation.clear();
		m_pendingAnnotation += text;
		m_annotationPending = true;
	}

	void TraceRecorder::writeDefinitions()
	{
		auto top = m_vcd.beginModule("usblink");
		m_vcd.declareString(m_annotationCode, "annotation");
		for (const Scope &scope : m_scopes)
		{
			auto module = m_vcd.beginModule(scope.name);
			for (const Field &field : scope.fields)
				m_vcd.declareWire(field.width, field.code, field.name);
		}
	}

	void TraceRecorder::writeField(const Field &field)
	{
		if (field.width == 1)
			m_vcd.writeBitState(field.code, true, field.value != 0);
		else
			m_vcd.writeState(field.code, field.width, ~0ull, field.value);
	}

	void TraceRecorder::sample(uint64_t cycle)
	{
		m_samples++;

		if (!m_started)
		{
			writeDefinitions();
			m_vcd.endDefinitions();
			m_started = true;

			m_vcd.writeTime(floor(m_period * ClockRational(cycle)));
			auto dump = m_vcd.beginDumpVars();
			m_vcd.writeString(m_annotationCode, m_annotationPending ? m_pendingAnnotation : std::string());
			m_annotationShown = m_annotationPending;
			m_annotationPending = false;

			for (Scope &scope : m_scopes)
			{
				scope.sample(m_values);
				USBLINK_ASSERT(m_values.size() == scope.fields.size());
				for (size_t i = 0; i < scope.fields.size(); ++i)
				{
					scope.fields[i].value = m_values[i];
					writeField(scope.fields[i]);
				}
			}
			return;
		}

		m_vcd.writeTime(floor(m_period * ClockRational(cycle)));

		if (m_annotationPending)
		{
			m_vcd.writeString(m_annotationCode, m_pendingAnnotation);
			m_annotationShown = true;
			m_annotationPending = false;
		}
		else if (m_annotationShown)
		{
			m_vcd.writeString(m_annotationCode, "");
			m_annotationShown = false;
		}

		for (Scope &scope : m_scopes)
		{
			scope.sample(m_values);
			for (size_t i = 0; i < scope.fields.size(); ++i)
			{
				Field &field = scope.fields[i];
				if (field.value == m_values[i])
					continue;

				field.value = m_values[i];
				writeField(field);
			}
		}
	}
}
