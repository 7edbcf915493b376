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


#ifndef B2_UPLOADER__TESTS__STUB_REMOTE_API__HPP
#define B2_UPLOADER__TESTS__STUB_REMOTE_API__HPP

#include "remote_api.hpp"
#include "chunk_buffer.hpp"
#include "error.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace b2 {
namespace test {

// In-memory storage which records every call made to it
struct stub_state_t {
	stub_state_t()
		: failing_upload_part_urls(0)
		, fail_start_large_file(false)
		, hold_parts(false)
		, authorize_calls(0)
		, list_buckets_calls(0)
		, get_upload_url_calls(0)
		, upload_file_calls(0)
		, start_large_file_calls(0)
		, get_upload_part_url_calls(0)
		, upload_part_calls(0)
		, finish_large_file_calls(0)
		, parts_acknowledged_at_finish(0)
		, sha1_mismatches(0)
		, file_size(0)
	{}

	typedef std::unique_lock<std::mutex> lock_guard_t;

	std::mutex mutex;

	std::vector<std::string> bucket_names;
	std::string account_id;
	std::string application_key;

	// part id -> number of attempts which fail before the first success
	std::map<size_t, size_t> part_failures;
	size_t failing_upload_part_urls;
	bool fail_start_large_file;
	// upload_part waits for cancellation and never succeeds
	bool hold_parts;

	size_t authorize_calls;
	size_t list_buckets_calls;
	size_t get_upload_url_calls;
	size_t upload_file_calls;
	size_t start_large_file_calls;
	size_t get_upload_part_url_calls;
	size_t upload_part_calls;
	size_t finish_large_file_calls;

	std::set<std::thread::id> part_upload_threads;
	std::vector<size_t> part_order;
	std::map<size_t, size_t> part_calls;
	std::map<size_t, size_t> part_sizes;
	std::map<size_t, std::string> part_sha1s;
	size_t parts_acknowledged_at_finish;
	size_t sha1_mismatches;

	std::string file_name;
	std::string file_content_type;
	std::string file_sha1;
	size_t file_size;
	file_info_t file_info;
};

typedef std::shared_ptr<stub_state_t> shared_stub_state_t;

class stub_upload_url_t : public upload_url_t
{
public:
	stub_upload_url_t(shared_stub_state_t state_)
		: state(std::move(state_))
	{}

	file_result_t
	upload_file(const cancellation_t &cancellation
			, const char *data, size_t size
			, const std::string &name, const std::string &content_type
			, const std::string &sha1, const file_info_t &info) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->upload_file_calls += 1;

		if (sha1_hex(data, size) != sha1) {
			state->sha1_mismatches += 1;
			throw remote_error(400, "sha1 mismatch");
		}

		state->file_name = name;
		state->file_content_type = content_type;
		state->file_sha1 = sha1;
		state->file_size = size;
		state->file_info = info;

		file_result_t result;
		result.id = "simple-" + name;
		result.name = name;
		result.size = size;
		result.sha1 = sha1;
		return result;
	}

private:
	shared_stub_state_t state;
};

class stub_upload_part_url_t : public upload_part_url_t
{
public:
	stub_upload_part_url_t(shared_stub_state_t state_)
		: state(std::move(state_))
	{}

	part_result_t
	upload_part(const cancellation_t &cancellation
			, const char *data, const std::string &sha1, size_t size, size_t part_id) {
		cancellation.check();

		bool hold = false;

		{
			stub_state_t::lock_guard_t lock_guard(state->mutex);
			(void) lock_guard;

			state->upload_part_calls += 1;
			state->part_calls[part_id] += 1;
			state->part_order.push_back(part_id);

			auto it = state->part_failures.find(part_id);

			if (it != state->part_failures.end() && it->second != 0) {
				it->second -= 1;
				throw remote_error(503, "part upload is temporarily unavailable");
			}

			hold = state->hold_parts;
		}

		while (hold) {
			cancellation.check();
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}

		auto actual_sha1 = sha1_hex(data, size);

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		if (actual_sha1 != sha1) {
			state->sha1_mismatches += 1;
			throw remote_error(400, "sha1 mismatch");
		}

		state->part_sizes[part_id] = size;
		state->part_sha1s[part_id] = sha1;

		part_result_t result;
		result.file_id = "large";
		result.part_id = part_id;
		result.size = size;
		result.sha1 = sha1;
		return result;
	}

private:
	shared_stub_state_t state;
};

class stub_large_file_t : public large_file_t
{
public:
	stub_large_file_t(shared_stub_state_t state_, std::string name_)
		: state(std::move(state_))
		, id("large-" + name_)
		, name(std::move(name_))
	{}

	const std::string &
	get_id() const {
		return id;
	}

	std::shared_ptr<upload_part_url_t>
	get_upload_part_url(const cancellation_t &cancellation) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->get_upload_part_url_calls += 1;
		state->part_upload_threads.insert(std::this_thread::get_id());

		if (state->failing_upload_part_urls != 0) {
			state->failing_upload_part_urls -= 1;
			throw remote_error(503, "no upload part url");
		}

		return std::make_shared<stub_upload_part_url_t>(state);
	}

	file_result_t
	finish_large_file(const cancellation_t &cancellation) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->finish_large_file_calls += 1;
		state->parts_acknowledged_at_finish = state->part_sizes.size();

		size_t size = 0;

		for (auto it = state->part_sizes.begin(), end = state->part_sizes.end(); it != end; ++it) {
			size += it->second;
		}

		file_result_t result;
		result.id = id;
		result.name = name;
		result.size = size;
		result.sha1 = "none";
		return result;
	}

private:
	shared_stub_state_t state;
	std::string id;
	std::string name;
};

class stub_bucket_t : public bucket_api_t
{
public:
	stub_bucket_t(shared_stub_state_t state_, std::string name_)
		: state(std::move(state_))
		, name(std::move(name_))
	{}

	const std::string &
	get_name() const {
		return name;
	}

	std::shared_ptr<upload_url_t>
	get_upload_url(const cancellation_t &cancellation) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->get_upload_url_calls += 1;
		return std::make_shared<stub_upload_url_t>(state);
	}

	std::shared_ptr<large_file_t>
	start_large_file(const cancellation_t &cancellation
			, const std::string &file_name, const std::string &content_type
			, const file_info_t &info) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->start_large_file_calls += 1;

		if (state->fail_start_large_file) {
			throw remote_error(500, "cannot start large file");
		}

		state->file_name = file_name;
		state->file_content_type = content_type;
		state->file_info = info;

		return std::make_shared<stub_large_file_t>(state, file_name);
	}

private:
	shared_stub_state_t state;
	std::string name;
};

class stub_account_t : public account_api_t
{
public:
	stub_account_t(shared_stub_state_t state_)
		: state(std::move(state_))
	{}

	std::vector<std::shared_ptr<bucket_api_t>>
	list_buckets(const cancellation_t &cancellation) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->list_buckets_calls += 1;

		std::vector<std::shared_ptr<bucket_api_t>> buckets;

		for (auto it = state->bucket_names.begin(), end = state->bucket_names.end(); it != end; ++it) {
			buckets.emplace_back(std::make_shared<stub_bucket_t>(state, *it));
		}

		return buckets;
	}

private:
	shared_stub_state_t state;
};

class stub_remote_api_t : public remote_api_t
{
public:
	stub_remote_api_t(shared_stub_state_t state_)
		: state(std::move(state_))
	{}

	std::shared_ptr<account_api_t>
	authorize_account(const cancellation_t &cancellation
			, const std::string &account_id, const std::string &application_key) {
		cancellation.check();

		stub_state_t::lock_guard_t lock_guard(state->mutex);
		(void) lock_guard;

		state->authorize_calls += 1;

		if (account_id != state->account_id || application_key != state->application_key) {
			throw authorization_error("bad credentials");
		}

		return std::make_shared<stub_account_t>(state);
	}

private:
	shared_stub_state_t state;
};

} // namespace test
} // namespace b2

#endif /* B2_UPLOADER__TESTS__STUB_REMOTE_API__HPP */

