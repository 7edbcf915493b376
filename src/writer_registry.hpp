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


#ifndef B2_UPLOADER__SRC__WRITER_REGISTRY__HPP
#define B2_UPLOADER__SRC__WRITER_REGISTRY__HPP

#include "writer.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace b2 {

// In-flight writers of one client keyed by "bucket/name", for diagnostics only.
// Nothing prevents two writers of the same key: the later add wins.
class writer_registry_t
{
public:
	void
	add(std::shared_ptr<writer_t> writer);

	void
	remove(const writer_t &writer);

	std::vector<writer_info_t>
	snapshot() const;

	size_t
	size() const;

private:
	typedef std::mutex mutex_t;
	typedef std::unique_lock<mutex_t> lock_guard_t;
	typedef std::map<std::string, std::shared_ptr<writer_t>> writers_t;

	mutable mutex_t mutex;
	std::unique_ptr<writers_t> writers;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__WRITER_REGISTRY__HPP */

