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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <stdexcept>
#include <iostream>


namespace usblink::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);


/// Exception base that records the call stack at the throw site.
template<class BaseError>
class TracedError : public BaseError
{
	public:
		TracedError(const char *file, size_t line, const std::string &what) :
				BaseError(composeErrorString(file, line, what)) {

			m_trace.record(20, 1);
		}
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class TracedError<std::logic_error>;
extern template class TracedError<std::runtime_error>;


/// Thrown when an internal invariant of the link layer breaks.
class InternalError : public TracedError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Thrown when the library is used or configured wrongly.
class DesignError : public TracedError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const TracedError<BaseError> &exception) {
	stream
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();

	return stream;
}

}
