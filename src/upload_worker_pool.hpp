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

#ifndef B2_UPLOADER__SRC__UPLOAD_WORKER_POOL__HPP
#define B2_UPLOADER__SRC__UPLOAD_WORKER_POOL__HPP

#include "channel.hpp"
#include "chunk_buffer.hpp"
#include "remote_api.hpp"
#include "cancellation.hpp"

#include <swarm/logger.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace b2 {

enum class upload_worker_pool_errc {
	  success
	, retries_exhausted
	, no_upload_part_url
};

const std::error_category &
upload_worker_pool_category();

std::error_code
make_error_code(upload_worker_pool_errc e);

std::error_condition
make_error_condition(upload_worker_pool_errc e);

class upload_worker_pool_error : public std::system_error
{
public:
	upload_worker_pool_error(upload_worker_pool_errc e, const std::string &message = "");
};

/*
 * Fixed set of threads uploading the parts of one large file.
 * Every thread asks for its own upload part url and then takes chunks from
 * the shared channel. A chunk which failed to upload is given back to the
 * channel with increased attempt counter and may be picked up by any thread.
 * A chunk which failed more than total_retries times fails the whole pool:
 * the channel is cancelled and the error is kept for the owner.
 */
class upload_worker_pool_t
{
public:
	upload_worker_pool_t(ioremap::swarm::logger bh_logger_
			, std::string bucket_name_
			, std::shared_ptr<large_file_t> large_file_
			, cancellation_t cancellation_
			, size_t workers_count_, size_t total_retries_);

	~upload_worker_pool_t();

	void
	start();

	// Blocks until some worker takes the chunk. Returns false if the pool
	// failed or was cancelled, get_error() tells why.
	bool
	submit(chunk_t chunk);

	// No more chunks, workers exit once the channel is drained
	void
	close();

	void
	cancel();

	void
	join();

	std::exception_ptr
	get_error() const;

	size_t
	get_workers_count() const;

	size_t
	get_parts_uploaded() const;

	size_t
	get_part_retries() const;

private:
	typedef channel_t<chunk_t> chunk_channel_t;

	class worker_t
	{
	public:
		worker_t(upload_worker_pool_t &pool_, size_t index_);

		void
		run();

	private:
		ioremap::swarm::logger &
		logger();

		std::shared_ptr<upload_part_url_t>
		get_upload_part_url();

		void
		upload(upload_part_url_t &upload_part_url, chunk_t chunk);

		upload_worker_pool_t &pool;
		size_t index;
		ioremap::swarm::logger bh_logger;
	};

	ioremap::swarm::logger &
	logger();

	void
	fail(std::exception_ptr error_);

	ioremap::swarm::logger bh_logger;
	std::string bucket_name;
	std::shared_ptr<large_file_t> large_file;
	cancellation_t cancellation;
	cancellation_t::subscription_t subscription;
	size_t workers_count;
	size_t total_retries;

	// Shared with the cancellation callback which may outlive the pool
	std::shared_ptr<chunk_channel_t> channel;
	std::vector<std::thread> threads;

	std::atomic<size_t> workers_with_url;
	std::atomic<size_t> parts_uploaded;
	std::atomic<size_t> part_retries;

	mutable std::mutex error_mutex;
	std::exception_ptr error;
};

} // namespace b2

namespace std {

template <>
struct is_error_code_enum<b2::upload_worker_pool_errc>
	: public true_type
{};

} // namespace std

#endif /* B2_UPLOADER__SRC__UPLOAD_WORKER_POOL__HPP */

