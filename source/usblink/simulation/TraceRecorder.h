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

#include "ClockRational.h"
#include "waveformFormats/VCDWriter.h"
#include "../utils/Exceptions.h"

#include <boost/hana/accessors.hpp>
#include <boost/hana/for_each.hpp>
#include <boost/hana/pair.hpp>
#include <boost/hana/string.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace usblink::sim
{
	/// Width in bits in which a field of the given type is dumped.
	template<typename T>
	constexpr size_t traceWidth()
	{
		if constexpr (std::is_same_v<T, bool>)
			return 1;
		else if constexpr (std::is_enum_v<T>)
			return sizeof(std::underlying_type_t<T>) * 8;
		else
			return sizeof(T) * 8;
	}

	template<typename T>
	uint64_t traceValue(const T &value)
	{
		if constexpr (std::is_enum_v<T>)
			return uint64_t(static_cast<std::underlying_type_t<T>>(value));
		else
			return uint64_t(value);
	}

	/**
	 * @brief Records structs adapted with BOOST_HANA_ADAPT_STRUCT into a VCD waveform, once per cycle.
	 * @details Each traced struct becomes a module whose members become wires. All scopes must be
	 * added before the first sample. A string signal carries free text annotations such as
	 * decoded packets.
	 */
	class TraceRecorder
	{
	public:
		TraceRecorder(std::string filename, ClockRational clockFrequency);
		~TraceRecorder();

		TraceRecorder(const TraceRecorder&) = delete;
		TraceRecorder &operator=(const TraceRecorder&) = delete;

		/// Traces the struct returned by source under the given module name.
		template<typename T>
		void addScope(std::string_view name, std::function<T()> source);

		/// Shows text on the annotation signal starting with the next sample.
		void annotate(std::string_view text);

		/// Samples all scopes and writes the changed members for the given cycle.
		void sample(uint64_t cycle);

		const std::string &filename() const { return m_filename; }
		size_t samples() const { return m_samples; }

	protected:
		struct Field
		{
			std::string name;
			size_t width = 1;
			std::string code;
			uint64_t value = 0;
		};

		struct Scope
		{
			std::string name;
			std::vector<Field> fields;
			std::function<void(std::vector<uint64_t>&)> sample;
		};

		void writeDefinitions();
		void writeField(const Field &field);
		std::string nextCode();

		std::string m_filename;
		VCDWriter m_vcd;
		ClockRational m_period;

		std::vector<Scope> m_scopes;
		std::vector<uint64_t> m_values;
		std::string m_annotationCode;
		std::string m_pendingAnnotation;
		bool m_annotationPending = false;
		bool m_annotationShown = false;
		bool m_started = false;
		size_t m_codeCounter = 0;
		size_t m_samples = 0;
	};

	template<typename T>
	void TraceRecorder::addScope(std::string_view name, std::function<T()> source)
	{
		USBLINK_DESIGNCHECK_HINT(!m_started, "scopes must be added before the first sample");

		Scope scope{ .name = std::string(name) };
		boost::hana::for_each(boost::hana::accessors<T>(), [&](auto member) {
			using Member = std::decay_t<decltype(boost::hana::second(member)(std::declval<const T&>()))>;
			scope.fields.push_back(Field{
				.name = boost::hana::to<const char*>(boost::hana::first(member)),
				.width = traceWidth<Member>(),
				.code = nextCode(),
			});
		});

		scope.sample = [source = std::move(source)](std::vector<uint64_t> &values) {
			const T value = source();
			values.clear();
			boost::hana::for_each(boost::hana::accessors<T>(), [&](auto member) {
				values.push_back(traceValue(boost::hana::second(member)(value)));
			});
		};

		m_scopes.push_back(std::move(scope));
	}
}
