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

#ifndef B2_UPLOADER__SRC__CHUNK_BUFFER__HPP
#define B2_UPLOADER__SRC__CHUNK_BUFFER__HPP

#include <crypto++/sha.h>

#include <string>
#include <vector>

namespace b2 {

struct chunk_t {
	typedef std::vector<char> buffer_t;

	chunk_t()
		: id(0)
		, attempt(0)
		, size(0)
	{}

	// Part number, starts from 1
	size_t id;
	size_t attempt;
	size_t size;
	std::string sha1;
	buffer_t buffer;
};

// Accumulates the bytes of one chunk. Every appended byte is folded into
// the running sha1 before append returns, so the digest always matches the
// buffered data.
class chunk_buffer_t
{
public:
	chunk_buffer_t(size_t capacity_);

	// Appends at most get_free_space() bytes, returns how many were taken
	size_t
	append(const char *data, size_t size);

	// Moves the buffered bytes and their digest into a chunk and starts over
	chunk_t
	seal(size_t id);

	const char *
	data() const;

	std::string
	get_sha1() const;

	size_t
	get_size() const;

	size_t
	get_capacity() const;

	size_t
	get_free_space() const;

	bool
	empty() const;

	bool
	is_full() const;

private:
	void
	reset();

	size_t capacity;
	chunk_t::buffer_t buffer;
	CryptoPP::SHA1 hash;
};

// Finalizes the hash, lowercase hex
std::string
digest_hex(CryptoPP::SHA1 &hash);

std::string
sha1_hex(const char *data, size_t size);

} // namespace b2

#endif /* B2_UPLOADER__SRC__CHUNK_BUFFER__HPP */

