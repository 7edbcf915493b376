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

#include "chunk_buffer.hpp"

#include <string>

namespace b2 {
namespace test {

TEST(chunk_buffer, sha1_hex) {
	std::string data = "abc";

	EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d", sha1_hex(data.data(), data.size()));
	EXPECT_EQ("da39a3ee5e6b4b0d3255bfef95601890afd80709", sha1_hex(data.data(), 0));
}

TEST(chunk_buffer, append_stops_at_capacity) {
	chunk_buffer_t buffer(4);
	std::string data = "abcdef";

	EXPECT_EQ(4, buffer.append(data.data(), data.size()));
	EXPECT_TRUE(buffer.is_full());
	EXPECT_EQ(0, buffer.get_free_space());
	EXPECT_EQ(0, buffer.append(data.data() + 4, 2));
	EXPECT_EQ(4, buffer.get_size());
}

TEST(chunk_buffer, seal_moves_data_and_digest) {
	chunk_buffer_t buffer(4);
	std::string data = "abcdef";

	buffer.append(data.data(), data.size());
	auto chunk = buffer.seal(7);

	EXPECT_EQ(7, chunk.id);
	EXPECT_EQ(0, chunk.attempt);
	EXPECT_EQ(4, chunk.size);
	EXPECT_EQ("abcd", std::string(chunk.buffer.begin(), chunk.buffer.end()));
	EXPECT_EQ(sha1_hex("abcd", 4), chunk.sha1);

	EXPECT_TRUE(buffer.empty());
	EXPECT_EQ(4, buffer.get_free_space());
	EXPECT_EQ("da39a3ee5e6b4b0d3255bfef95601890afd80709", buffer.get_sha1());
}

TEST(chunk_buffer, digest_follows_appended_bytes) {
	chunk_buffer_t buffer(16);

	buffer.append("ab", 2);
	EXPECT_EQ(sha1_hex("ab", 2), buffer.get_sha1());

	buffer.append("c", 1);
	EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d", buffer.get_sha1());
	EXPECT_EQ("abc", std::string(buffer.data(), buffer.get_size()));

	auto chunk = buffer.seal(1);
	EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d", chunk.sha1);

	buffer.append("xyz", 3);
	EXPECT_EQ(sha1_hex("xyz", 3), buffer.seal(2).sha1);
}

} // namespace test
} // namespace b2
