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

#include "chunk_buffer.hpp"
#include "hex.hpp"

#include <algorithm>

b2::chunk_buffer_t::chunk_buffer_t(size_t capacity_)
	: capacity(capacity_)
{
}

size_t
b2::chunk_buffer_t::append(const char *data, size_t size) {
	using namespace CryptoPP;

	size_t part_size = std::min(size, get_free_space());

	if (part_size == 0) {
		return 0;
	}

	// The buffer goes first: if it throws, the digest stays untouched
	buffer.insert(buffer.end(), data, data + part_size);
	hash.Update(reinterpret_cast<const byte *>(data), part_size);

	return part_size;
}

b2::chunk_t
b2::chunk_buffer_t::seal(size_t id) {
	chunk_t chunk;

	chunk.id = id;
	chunk.size = buffer.size();
	chunk.sha1 = digest_hex(hash);
	chunk.buffer.swap(buffer);

	reset();

	return chunk;
}

const char *
b2::chunk_buffer_t::data() const {
	return buffer.data();
}

std::string
b2::chunk_buffer_t::get_sha1() const {
	CryptoPP::SHA1 copy(hash);
	return digest_hex(copy);
}

size_t
b2::chunk_buffer_t::get_size() const {
	return buffer.size();
}

size_t
b2::chunk_buffer_t::get_capacity() const {
	return capacity;
}

size_t
b2::chunk_buffer_t::get_free_space() const {
	return capacity - buffer.size();
}

bool
b2::chunk_buffer_t::empty() const {
	return buffer.empty();
}

bool
b2::chunk_buffer_t::is_full() const {
	return buffer.size() == capacity;
}

void
b2::chunk_buffer_t::reset() {
	chunk_t::buffer_t().swap(buffer);
	hash.Restart();
}

std::string
b2::digest_hex(CryptoPP::SHA1 &hash) {
	using namespace CryptoPP;

	std::vector<byte> digest(hash.DigestSize());
	hash.Final(digest.data());

	return hex<std::string>(digest);
}

std::string
b2::sha1_hex(const char *data, size_t size) {
	using namespace CryptoPP;

	SHA1 hash;
	hash.Update(reinterpret_cast<const byte *>(data), size);

	return digest_hex(hash);
}
