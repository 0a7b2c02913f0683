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
#include "StackTrace.h"

#include "Enumerate.h"
#include "Range.h"

#include <boost/format.hpp>


template class std::vector<boost::stacktrace::frame>;

namespace usblink::utils
{

	void StackTrace::record(size_t size, size_t skipTop)
	{
		boost::stacktrace::stacktrace trace(skipTop, size);

		m_trace.resize(trace.size());
		for (auto i : Range(trace.size()))
			m_trace[i] = trace[i];
	}

	std::vector<std::string> StackTrace::formatEntries() const
	{
		static FrameResolver resolver;

		std::vector<std::string> result;
		result.resize(m_trace.size());
		for (auto i : Range(m_trace.size()))
			result[i] = resolver.to_string(m_trace[i]);

		return result;
	}

	static bool isReportingFrame(std::string_view formatted)
	{
		if (formatted.starts_with('`'))
			formatted.remove_prefix(1);

		return formatted.starts_with("boost::") ||
			formatted.starts_with("std::") ||
			formatted.starts_with("usblink::utils::") ||
			formatted.starts_with("usblink::dbg::");
	}

	std::vector<std::string> StackTrace::formatEntriesFiltered() const
	{
		static FrameResolver resolver;

		std::vector<std::string> result;
		for (auto i : Range(m_trace.size()))
		{
			std::string formatted = resolver.to_string(m_trace[i]);
			if (!isReportingFrame(formatted))
				result.emplace_back(std::move(formatted));
		}

		while (!result.empty())
			if (!result.back().starts_with("main "))
				result.pop_back();
			else
				break;

		if (result.size() > 1)
		{
			// remove common path prefix
			std::string prefix;

			for (const std::string& frame : result)
			{
				size_t pos = frame.find(" at ");
				if (pos == std::string::npos)
					continue;
				pos += 4;

				if (prefix.empty())
				{
					prefix = frame.substr(pos);
					continue;
				}

				size_t prefixLen = 0;
				for (char ref : prefix)
					if (pos == frame.size() || ref != frame[pos++])
						break;
					else
						prefixLen++;

				prefix.resize(prefixLen);
			}

			for (std::string& frame : result)
			{
				size_t pos = frame.find(" at ");
				if (pos == std::string::npos)
					continue;
				pos += 4;

				if (pos + prefix.size() <= frame.length())
					frame = frame.substr(0, pos) + frame.substr(pos + prefix.size());
				else
					frame = frame.substr(0, pos);
			}
		}

		return result;
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		auto symbols = trace.formatEntriesFiltered();
		for (auto p : Enumerate(symbols))
			stream << "	" << p.first << ": " << p.second << std::endl;

		return stream;
	}

	std::string FrameResolver::to_string(const boost::stacktrace::frame& frame)
	{
		return (boost::format("%s at %s:%d") % frame.name() % frame.source_file() % frame.source_line()).str();
	}
}
