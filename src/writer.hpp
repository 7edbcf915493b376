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


#ifndef B2_UPLOADER__SRC__WRITER__HPP
#define B2_UPLOADER__SRC__WRITER__HPP

#include "remote_api.hpp"
#include "cancellation.hpp"
#include "chunk_buffer.hpp"
#include "upload_worker_pool.hpp"

#include <swarm/logger.hpp>

#include <boost/optional.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace b2 {

enum class writer_errc {
	  success
	, unexpected_event
	, failed
};

const std::error_category &
writer_category();

std::error_code
make_error_code(writer_errc e);

std::error_condition
make_error_condition(writer_errc e);

class writer_error : public std::system_error
{
public:
	writer_error(writer_errc e, const std::string &message = "");
};

struct writer_options_t {
	writer_options_t()
		: concurrent_uploads(1)
		, total_retries(5)
		, part_size(large_file_threshold)
	{}

	// Number of threads uploading parts of one large file, 0 is treated as 1
	size_t concurrent_uploads;

	// How many times a part may fail before the whole upload fails
	size_t total_retries;

	// 0 or anything above large_file_threshold means large_file_threshold.
	// Files up to part_size bytes take the single request path
	size_t part_size;
};

struct writer_info_t {
	std::string bucket;
	std::string name;
	std::string key;
	std::string state;
	size_t bytes_written;
	size_t parts_sealed;
	size_t parts_uploaded;
	size_t part_retries;
	size_t workers;
};

/*
 * Streams a file into a bucket.
 * Data is collected into a buffer of part_size bytes. If the file fits into
 * one buffer it is uploaded by a single request on close. Otherwise the large
 * file is started once the buffer overflows for the first time, and every
 * full buffer is handed to the upload worker pool as a numbered part.
 *
 * write() and close() must be called from one thread.
 */
class writer_t
{
public:
	writer_t(ioremap::swarm::logger bh_logger_
			, std::shared_ptr<bucket_api_t> bucket_
			, cancellation_t cancellation_
			, std::string name_, std::string content_type_
			, file_info_t info_
			, writer_options_t options_ = writer_options_t());

	~writer_t();

	// Returns the number of consumed bytes, which is always size on success
	size_t
	write(const char *data, size_t size);

	// Only the first call does the job, the rest return immediately
	void
	close();

	const file_result_t &
	get_result() const;

	const std::string &
	get_bucket_name() const;

	const std::string &
	get_name() const;

	std::string
	get_key() const;

	writer_info_t
	get_info() const;

	bool
	is_closed() const;

	bool
	is_failed() const;

private:
	enum class state_tag {
		  buffering
		, uploading_parts
		, closing
		, closed
		, failed
	};

	ioremap::swarm::logger &
	logger();

	void
	seal_chunk();

	void
	start_large_file();

	void
	close_simple();

	void
	close_large();

	void
	fail(std::exception_ptr error_);

	uint64_t
	instance_id() const;

	static const char *
	state_name(state_tag state);

	std::atomic<state_tag> state;

	ioremap::swarm::logger bh_logger;
	std::shared_ptr<bucket_api_t> bucket;

	// Own token of the writer, cancelled together with the caller's one
	// or by the destructor
	cancellation_t parent_cancellation;
	cancellation_t::subscription_t subscription;
	cancellation_t cancellation;

	std::string name;
	std::string content_type;
	file_info_t info;
	writer_options_t options;

	chunk_buffer_t buffer;
	size_t next_chunk_id;

	std::shared_ptr<large_file_t> large_file;
	// Guards the pointer only, get_info() may run on another thread
	mutable std::mutex upload_worker_pool_mutex;
	std::unique_ptr<upload_worker_pool_t> upload_worker_pool;

	std::exception_ptr error;
	bool close_called;

	boost::optional<file_result_t> result;

	std::atomic<size_t> bytes_written;
	std::atomic<size_t> parts_sealed;

	std::chrono::system_clock::time_point start_time;
};

} // namespace b2

namespace std {

template <>
struct is_error_code_enum<b2::writer_errc>
	: public true_type
{};

} // namespace std

#endif /* B2_UPLOADER__SRC__WRITER__HPP */

