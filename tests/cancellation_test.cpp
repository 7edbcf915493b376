/*
	B2-uploader is a streaming uploader for B2-like object storages
	Copyright (C) 2013-2015 Yandex

	This program is free software; you can redistribute it and/or
	modify it under the terms of the GNU General Public License
	as published by the Free Software Foundation; either version 2
	of the License, or (at your option) any later version.

	This program is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with this program; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/


#include <gtest/gtest.h>

#include "cancellation.hpp"
#include "error.hpp"

namespace b2 {
namespace test {

TEST(cancellation, copies_share_state) {
	cancellation_t cancellation;
	auto copy = cancellation;

	EXPECT_FALSE(copy.is_cancelled());
	EXPECT_NO_THROW(copy.check());

	cancellation.cancel();

	EXPECT_TRUE(copy.is_cancelled());
	EXPECT_THROW(copy.check(), cancelled_error);
}

TEST(cancellation, callbacks_run_once) {
	cancellation_t cancellation;
	size_t calls = 0;

	cancellation.subscribe([&calls] { ++calls; });
	cancellation.cancel();
	cancellation.cancel();

	EXPECT_EQ(1, calls);
}

TEST(cancellation, late_subscriber_is_called_immediately) {
	cancellation_t cancellation;
	bool called = false;

	cancellation.cancel();
	cancellation.subscribe([&called] { called = true; });

	EXPECT_TRUE(called);
}

TEST(cancellation, unsubscribed_callback_is_not_called) {
	cancellation_t cancellation;
	bool called = false;

	auto subscription = cancellation.subscribe([&called] { called = true; });
	cancellation.unsubscribe(subscription);
	cancellation.cancel();

	EXPECT_FALSE(called);
}

TEST(cancellation, callback_may_cancel_another_token) {
	cancellation_t parent;
	cancellation_t child;

	parent.subscribe([child] () mutable { child.cancel(); });
	parent.cancel();

	EXPECT_TRUE(child.is_cancelled());
}

} // namespace test
} // namespace b2
