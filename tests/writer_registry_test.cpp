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

#include "writer_registry.hpp"

#include "stub_remote_api.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace b2 {
namespace test {

namespace {

std::shared_ptr<writer_t>
make_writer(const std::shared_ptr<bucket_api_t> &bucket, const std::string &name) {
	return std::make_shared<writer_t>(test_logger(), bucket, cancellation_t()
			, name, "application/octet-stream", file_info_t());
}

} // namespace

TEST(writer_registry, empty_registry) {
	writer_registry_t registry;
	auto bucket = std::make_shared<stub_bucket_t>(std::make_shared<stub_state_t>(), "bucket");
	auto writer = make_writer(bucket, "file");

	EXPECT_EQ(0, registry.size());
	EXPECT_TRUE(registry.snapshot().empty());

	registry.remove(*writer);
	EXPECT_EQ(0, registry.size());
}

TEST(writer_registry, add_and_remove) {
	writer_registry_t registry;
	auto bucket = std::make_shared<stub_bucket_t>(std::make_shared<stub_state_t>(), "bucket");
	auto first = make_writer(bucket, "first");
	auto second = make_writer(bucket, "dir/second");

	registry.add(first);
	registry.add(second);

	auto writers = registry.snapshot();
	ASSERT_EQ(2, writers.size());

	std::vector<std::string> keys;
	for (auto it = writers.begin(), end = writers.end(); it != end; ++it) {
		keys.push_back(it->key);
	}
	std::sort(keys.begin(), keys.end());

	EXPECT_EQ(std::vector<std::string>({"bucket/dir/second", "bucket/first"}), keys);

	registry.remove(*first);

	writers = registry.snapshot();
	ASSERT_EQ(1, writers.size());
	EXPECT_EQ("bucket/dir/second", writers.front().key);
	EXPECT_EQ("buffering", writers.front().state);
}

TEST(writer_registry, later_writer_replaces_earlier_one) {
	writer_registry_t registry;
	auto bucket = std::make_shared<stub_bucket_t>(std::make_shared<stub_state_t>(), "bucket");
	auto first = make_writer(bucket, "file");
	auto second = make_writer(bucket, "file");

	second->write("abc", 3);

	registry.add(first);
	registry.add(second);

	auto writers = registry.snapshot();
	ASSERT_EQ(1, writers.size());
	EXPECT_EQ(3, writers.front().bytes_written);
}

TEST(writer_registry, concurrent_access) {
	writer_registry_t registry;
	auto bucket = std::make_shared<stub_bucket_t>(std::make_shared<stub_state_t>(), "bucket");

	std::vector<std::thread> threads;

	for (size_t thread_index = 0; thread_index != 8; ++thread_index) {
		threads.emplace_back([&registry, &bucket, thread_index] {
			for (size_t index = 0; index != 50; ++index) {
				auto writer = make_writer(bucket, "file-" + std::to_string(thread_index)
						+ "-" + std::to_string(index));
				registry.add(writer);
				registry.snapshot();
				registry.remove(*writer);
			}
		});
	}

	for (auto it = threads.begin(), end = threads.end(); it != end; ++it) {
		it->join();
	}

	EXPECT_EQ(0, registry.size());
}

} // namespace test
} // namespace b2
