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

#ifndef B2_UPLOADER__SRC__HANDYSTATS__HPP
#define B2_UPLOADER__SRC__HANDYSTATS__HPP

#include <cstdint>
#include <string>

#include <handystats/measuring_points.hpp>

// b2.BUCKET.file.simple (counter)
//    - files uploaded with a single request
// b2.BUCKET.file.large (counter)
//    - files uploaded in parts
// b2.BUCKET.file.time (timer)
//    - time between the creation and the successful close of a writer
// b2.BUCKET.part.uploaded (counter)
//    - parts acknowledged by the storage
// b2.BUCKET.part.failed (counter)
//    - failed attempts to upload a part


namespace b2 {

// FILE

inline void B2_FILE_START(const std::string& bucket, const uint64_t& instance_id) {
	HANDY_TIMER_START(("b2.%s.file.time", bucket.c_str()), instance_id);
}

inline void B2_FILE_SIMPLE(const std::string& bucket, const uint64_t& instance_id) {
	HANDY_COUNTER_INCREMENT(("b2.%s.file.simple", bucket.c_str()));
	HANDY_TIMER_STOP(("b2.%s.file.time", bucket.c_str()), instance_id);
}

inline void B2_FILE_LARGE(const std::string& bucket, const uint64_t& instance_id) {
	HANDY_COUNTER_INCREMENT(("b2.%s.file.large", bucket.c_str()));
	HANDY_TIMER_STOP(("b2.%s.file.time", bucket.c_str()), instance_id);
}

inline void B2_FILE_DISCARD(const std::string& bucket, const uint64_t& instance_id) {
	HANDY_TIMER_DISCARD(("b2.%s.file.time", bucket.c_str()), instance_id);
}


// PART

inline void B2_PART_UPLOADED(const std::string& bucket) {
	HANDY_COUNTER_INCREMENT(("b2.%s.part.uploaded", bucket.c_str()));
}

inline void B2_PART_FAILED(const std::string& bucket) {
	HANDY_COUNTER_INCREMENT(("b2.%s.part.failed", bucket.c_str()));
}

} // namespace b2

#endif // B2_UPLOADER__SRC__HANDYSTATS__HPP
