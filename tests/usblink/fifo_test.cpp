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
#include "pch.h"
#include <boost/test/unit_test.hpp>

#include <usblink/simulation/TransactionalFifo.h>

using namespace boost::unit_test;
using namespace usblink;

BOOST_AUTO_TEST_CASE(fifo_push_visible_after_commit)
{
	sim::TransactionalFifo<int> fifo(4);
	fifo.push(1);
	fifo.push(2);
	BOOST_TEST(fifo.space() == 2);
	fifo.commit();

	BOOST_TEST(fifo.empty());
	BOOST_TEST(fifo.stagedSize() == 2);

	fifo.commitPush();
	fifo.commit();
	BOOST_TEST(fifo.size() == 2);
	BOOST_TEST(fifo.stagedSize() == 0);
	BOOST_TEST(fifo.peek() == 1);
}

BOOST_AUTO_TEST_CASE(fifo_push_rollback)
{
	sim::TransactionalFifo<int> fifo(4);
	fifo.push(1);
	fifo.commitPush();
	fifo.commit();

	fifo.push(2);
	fifo.commit();
	fifo.push(3);
	fifo.rollbackPush();
	fifo.commit();

	BOOST_TEST(fifo.size() == 1);
	BOOST_TEST(fifo.stagedSize() == 0);
	BOOST_TEST(fifo.space() == 3);
}

BOOST_AUTO_TEST_CASE(fifo_pop_rollback)
{
	sim::TransactionalFifo<int> fifo(4);
	for (int i = 1; i <= 3; ++i)
		fifo.push(i);
	fifo.commitPush();
	fifo.commit();

	fifo.pop();
	fifo.commit();
	fifo.pop();
	fifo.commit();
	BOOST_TEST(fifo.size() == 1);
	BOOST_TEST(fifo.peek() == 3);
	// popped elements still occupy their slots
	BOOST_TEST(fifo.space() == 1);

	fifo.rollbackPop();
	fifo.commit();
	BOOST_TEST(fifo.size() == 3);
	BOOST_TEST(fifo.peek() == 1);

	fifo.pop();
	fifo.commitPop();
	fifo.commit();
	BOOST_TEST(fifo.size() == 2);
	BOOST_TEST(fifo.peek() == 2);
	BOOST_TEST(fifo.space() == 2);
}

BOOST_AUTO_TEST_CASE(fifo_limits)
{
	BOOST_CHECK_THROW(sim::TransactionalFifo<int>(0), utils::DesignError);

	sim::TransactionalFifo<int> fifo(2);
	BOOST_CHECK_THROW(fifo.peek(), utils::InternalError);
	BOOST_CHECK_THROW(fifo.pop(), utils::InternalError);

	fifo.push(1);
	fifo.push(2);
	BOOST_TEST(fifo.full());
	BOOST_CHECK_THROW(fifo.push(3), utils::InternalError);
	fifo.commitPush();
	fifo.commit();

	fifo.reset();
	BOOST_TEST(fifo.empty());
	BOOST_TEST(fifo.space() == 2);
}
