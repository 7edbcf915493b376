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


#ifndef B2_UPLOADER__TESTS__TEST_UTILS__HPP
#define B2_UPLOADER__TESTS__TEST_UTILS__HPP

#include "writer.hpp"
#include "chunk_buffer.hpp"

#include <swarm/logger.hpp>

#include <crypto++/sha.h>

#include <algorithm>
#include <string>
#include <vector>

namespace b2 {
namespace test {

// Messages go nowhere, no frontend is attached
inline ioremap::swarm::logger
test_logger() {
	static ioremap::swarm::logger_base base;
	return ioremap::swarm::logger(base, blackhole::log::attributes_t());
}

inline char
pattern_byte(size_t offset) {
	return static_cast<char>('a' + offset % 26);
}

inline std::string
make_pattern(size_t offset, size_t size) {
	std::string result;
	result.reserve(size);

	for (size_t index = 0; index != size; ++index) {
		result.push_back(pattern_byte(offset + index));
	}

	return result;
}

inline std::string
pattern_sha1(size_t offset, size_t size) {
	using namespace CryptoPP;

	SHA1 hash;
	const size_t block_size = 1 << 20;

	while (size != 0) {
		auto block = make_pattern(offset, std::min(size, block_size));
		hash.Update(reinterpret_cast<const byte *>(block.data()), block.size());
		offset += block.size();
		size -= block.size();
	}

	return digest_hex(hash);
}

// Writes size bytes of the pattern in blocks of block_size
inline void
write_pattern(writer_t &writer, size_t size, size_t block_size = 1 << 20) {
	size_t offset = 0;

	while (offset != size) {
		auto block = make_pattern(offset, std::min(size - offset, block_size));
		writer.write(block.data(), block.size());
		offset += block.size();
	}
}

} // namespace test
} // namespace b2

#endif /* B2_UPLOADER__TESTS__TEST_UTILS__HPP */

