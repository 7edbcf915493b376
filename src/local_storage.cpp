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


#include "local_storage.hpp"
#include "chunk_buffer.hpp"
#include "loggers.hpp"
#include "error.hpp"

#include <boost/lexical_cast.hpp>

#include <crypto++/sha.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>

namespace {

typedef b2::local_storage_t::context_t context_t;
typedef std::shared_ptr<context_t> shared_context_t;

const char *large_files_directory = ".large-files";

std::string
join_path(const std::string &lhs, const std::string &rhs) {
	return lhs + '/' + rhs;
}

b2::remote_error
io_error(const std::string &action, const std::string &path) {
	int errc = errno;

	std::ostringstream oss;
	oss << "cannot " << action << " \"" << path << "\": " << std::strerror(errc);

	return b2::remote_error(500, oss.str());
}

void
make_directory(const std::string &path) {
	if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
		throw io_error("create directory", path);
	}
}

void
write_file(const std::string &path, const char *data, size_t size) {
	std::ofstream output(path.c_str(), std::ios::binary | std::ios::trunc);

	if (!output) {
		throw io_error("open", path);
	}

	output.write(data, size);
	output.close();

	if (!output) {
		throw io_error("write", path);
	}
}

void
rename_file(const std::string &from, const std::string &to) {
	if (std::rename(from.c_str(), to.c_str()) != 0) {
		throw io_error("rename", from);
	}
}

void
check_content(const char *data, size_t size, size_t expected_size
		, const std::string &expected_sha1) {
	if (size != expected_size) {
		std::ostringstream oss;
		oss << "size mismatch: expected=" << expected_size << " actual=" << size;
		throw b2::remote_error(400, oss.str());
	}

	auto sha1 = b2::sha1_hex(data, size);

	if (sha1 != expected_sha1) {
		throw b2::remote_error(400, "sha1 mismatch: expected=" + expected_sha1
				+ " actual=" + sha1);
	}
}

class local_upload_url_t : public b2::upload_url_t
{
public:
	local_upload_url_t(shared_context_t context_, std::string bucket_name_)
		: context(std::move(context_))
		, bucket_name(std::move(bucket_name_))
	{}

	b2::file_result_t
	upload_file(const b2::cancellation_t &cancellation
			, const char *data, size_t size
			, const std::string &name, const std::string &content_type
			, const std::string &sha1, const b2::file_info_t &info) {
		(void) content_type;
		(void) info;

		cancellation.check();
		check_content(data, size, size, sha1);

		auto bucket_path = join_path(context->config.root, bucket_name);
		make_directory(context->config.root);
		make_directory(bucket_path);

		auto path = join_path(bucket_path, b2::escape_file_name(name));
		auto tmp_path = path + ".tmp." + context->generate_id();

		write_file(tmp_path, data, size);
		rename_file(tmp_path, path);

		b2::file_result_t result;
		result.id = context->generate_id();
		result.name = name;
		result.size = size;
		result.sha1 = sha1;

		BH_LOG(context->bh_logger, SWARM_LOG_INFO
				, "file is stored: bucket=%s name=%s path=%s size=%llu"
				, bucket_name.c_str(), name.c_str(), path.c_str()
				, static_cast<unsigned long long>(size));

		return result;
	}

private:
	shared_context_t context;
	std::string bucket_name;
};

struct large_file_state_t {
	large_file_state_t(shared_context_t context_, std::string bucket_name_
			, std::string id_, std::string name_)
		: context(std::move(context_))
		, bucket_name(std::move(bucket_name_))
		, id(std::move(id_))
		, name(std::move(name_))
		, parts_path(join_path(join_path(context->config.root, large_files_directory), id))
		, finished(false)
	{}

	shared_context_t context;
	std::string bucket_name;
	std::string id;
	std::string name;
	std::string parts_path;

	std::mutex mutex;
	std::set<size_t> parts;
	bool finished;
};

typedef std::shared_ptr<large_file_state_t> shared_large_file_state_t;

class local_upload_part_url_t : public b2::upload_part_url_t
{
public:
	local_upload_part_url_t(shared_large_file_state_t state_)
		: state(std::move(state_))
	{}

	b2::part_result_t
	upload_part(const b2::cancellation_t &cancellation
			, const char *data, const std::string &sha1, size_t size, size_t part_id) {
		cancellation.check();

		if (part_id == 0) {
			throw b2::remote_error(400, "part numbers start from 1");
		}

		if (size > b2::large_file_threshold) {
			throw b2::remote_error(400, "part is too large");
		}

		check_content(data, size, size, sha1);

		auto part_name = boost::lexical_cast<std::string>(part_id);
		auto path = join_path(state->parts_path, part_name);
		auto tmp_path = path + ".tmp." + state->context->generate_id();

		write_file(tmp_path, data, size);
		rename_file(tmp_path, path);

		{
			std::lock_guard<std::mutex> lock_guard(state->mutex);
			(void) lock_guard;

			if (state->finished) {
				throw b2::remote_error(400, "large file is already finished");
			}

			state->parts.insert(part_id);
		}

		b2::part_result_t result;
		result.file_id = state->id;
		result.part_id = part_id;
		result.size = size;
		result.sha1 = sha1;

		return result;
	}

private:
	shared_large_file_state_t state;
};

class local_large_file_t : public b2::large_file_t
{
public:
	local_large_file_t(shared_large_file_state_t state_)
		: state(std::move(state_))
	{}

	const std::string &
	get_id() const {
		return state->id;
	}

	std::shared_ptr<b2::upload_part_url_t>
	get_upload_part_url(const b2::cancellation_t &cancellation) {
		cancellation.check();
		return std::make_shared<local_upload_part_url_t>(state);
	}

	b2::file_result_t
	finish_large_file(const b2::cancellation_t &cancellation) {
		cancellation.check();

		std::lock_guard<std::mutex> lock_guard(state->mutex);
		(void) lock_guard;

		if (state->finished) {
			throw b2::remote_error(400, "large file is already finished");
		}

		if (state->parts.empty()) {
			throw b2::remote_error(400, "large file has no parts");
		}

		// Parts are 1..n without gaps
		if (*state->parts.begin() != 1 || *state->parts.rbegin() != state->parts.size()) {
			throw b2::remote_error(400, "large file has missing parts");
		}

		auto bucket_path = join_path(state->context->config.root, state->bucket_name);
		make_directory(bucket_path);

		auto path = join_path(bucket_path, b2::escape_file_name(state->name));
		auto tmp_path = path + ".tmp." + state->id;

		CryptoPP::SHA1 hash;
		size_t total_size = 0;

		{
			std::ofstream output(tmp_path.c_str(), std::ios::binary | std::ios::trunc);

			if (!output) {
				throw io_error("open", tmp_path);
			}

			std::vector<char> block(1 << 20);

			for (auto it = state->parts.begin(), end = state->parts.end(); it != end; ++it) {
				auto part_path = join_path(state->parts_path
						, boost::lexical_cast<std::string>(*it));
				std::ifstream input(part_path.c_str(), std::ios::binary);

				if (!input) {
					throw io_error("open", part_path);
				}

				while (input) {
					input.read(block.data(), block.size());
					auto count = static_cast<size_t>(input.gcount());

					hash.Update(reinterpret_cast<const unsigned char *>(block.data()), count);
					output.write(block.data(), count);
					total_size += count;
				}

				if (!input.eof()) {
					throw io_error("read", part_path);
				}
			}

			output.close();

			if (!output) {
				throw io_error("write", tmp_path);
			}
		}

		rename_file(tmp_path, path);

		for (auto it = state->parts.begin(), end = state->parts.end(); it != end; ++it) {
			auto part_path = join_path(state->parts_path, boost::lexical_cast<std::string>(*it));

			if (unlink(part_path.c_str()) != 0) {
				auto error = io_error("remove", part_path);
				BH_LOG(state->context->bh_logger, SWARM_LOG_WARNING, "%s", error.what());
			}
		}

		if (rmdir(state->parts_path.c_str()) != 0) {
			auto error = io_error("remove", state->parts_path);
			BH_LOG(state->context->bh_logger, SWARM_LOG_WARNING, "%s", error.what());
		}

		state->finished = true;

		b2::file_result_t result;
		result.id = state->id;
		result.name = state->name;
		result.size = total_size;
		result.sha1 = b2::digest_hex(hash);

		BH_LOG(state->context->bh_logger, SWARM_LOG_INFO
				, "large file is stored: bucket=%s name=%s path=%s size=%llu parts=%llu"
				, state->bucket_name.c_str(), state->name.c_str(), path.c_str()
				, static_cast<unsigned long long>(total_size)
				, static_cast<unsigned long long>(state->parts.size()));

		return result;
	}

private:
	shared_large_file_state_t state;
};

class local_bucket_api_t : public b2::bucket_api_t
{
public:
	local_bucket_api_t(shared_context_t context_, std::string name_)
		: context(std::move(context_))
		, name(std::move(name_))
	{}

	const std::string &
	get_name() const {
		return name;
	}

	std::shared_ptr<b2::upload_url_t>
	get_upload_url(const b2::cancellation_t &cancellation) {
		cancellation.check();
		return std::make_shared<local_upload_url_t>(context, name);
	}

	std::shared_ptr<b2::large_file_t>
	start_large_file(const b2::cancellation_t &cancellation
			, const std::string &file_name, const std::string &content_type
			, const b2::file_info_t &info) {
		(void) content_type;
		(void) info;

		cancellation.check();

		// Rejects bad names before any part is stored
		b2::escape_file_name(file_name);

		auto state = std::make_shared<large_file_state_t>(context, name
				, context->generate_id(), file_name);

		make_directory(context->config.root);
		make_directory(join_path(context->config.root, large_files_directory));
		make_directory(state->parts_path);

		BH_LOG(context->bh_logger, SWARM_LOG_INFO
				, "large file is started: bucket=%s name=%s id=%s"
				, name.c_str(), file_name.c_str(), state->id.c_str());

		return std::make_shared<local_large_file_t>(std::move(state));
	}

private:
	shared_context_t context;
	std::string name;
};

class local_account_api_t : public b2::account_api_t
{
public:
	local_account_api_t(shared_context_t context_)
		: context(std::move(context_))
	{}

	std::vector<std::shared_ptr<b2::bucket_api_t>>
	list_buckets(const b2::cancellation_t &cancellation) {
		cancellation.check();

		std::vector<std::shared_ptr<b2::bucket_api_t>> buckets;
		const auto &names = context->config.buckets;

		for (auto it = names.begin(), end = names.end(); it != end; ++it) {
			buckets.emplace_back(std::make_shared<local_bucket_api_t>(context, *it));
		}

		return buckets;
	}

private:
	shared_context_t context;
};

} // namespace

std::string
b2::local_storage_t::context_t::generate_id() {
	auto now = std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();

	std::ostringstream oss;
	oss << now << '-' << getpid() << '-' << next_id++;
	return oss.str();
}

b2::local_storage_t::local_storage_t(ioremap::swarm::logger bh_logger_
		, local_storage_config_t config_)
	: context(std::make_shared<context_t>(std::move(bh_logger_), std::move(config_)))
{
}

std::shared_ptr<b2::account_api_t>
b2::local_storage_t::authorize_account(const cancellation_t &cancellation
		, const std::string &account_id, const std::string &application_key) {
	cancellation.check();

	if (account_id != context->config.account_id
			|| application_key != context->config.application_key) {
		BH_LOG(context->bh_logger, SWARM_LOG_ERROR
				, "authorization failed: account-id=%s", account_id.c_str());
		throw authorization_error("bad account id or application key");
	}

	return std::make_shared<local_account_api_t>(context);
}

std::string
b2::escape_file_name(const std::string &name) {
	if (name.empty()) {
		throw remote_error(400, "file name is empty");
	}

	// These two would point at the bucket directory or the root itself
	if (name == "." || name == "..") {
		return name == "." ? "%2E" : "%2E%2E";
	}

	std::string result;
	result.reserve(name.size());

	for (auto it = name.begin(), end = name.end(); it != end; ++it) {
		switch (*it) {
		case '/':
			result.append("%2F");
			break;
		case '%':
			result.append("%25");
			break;
		default:
			result.push_back(*it);
		}
	}

	return result;
}
