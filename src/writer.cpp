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


#include "writer.hpp"
#include "loggers.hpp"
#include "error.hpp"
#include "handystats.hpp"

#include <algorithm>
#include <sstream>

namespace {

class error_category_t
	: public std::error_category
{
public:
	const char *
	name() const noexcept {
		return "writer error category";
	}

	std::string
	message(int ev) const {
		switch (static_cast<b2::writer_errc>(ev)) {
		case b2::writer_errc::success:
			return "success";
		case b2::writer_errc::unexpected_event:
			return "unexpected event";
		case b2::writer_errc::failed:
			return "writer failed";
		default:
			return "unknown error";
		}
	}
};

size_t
normalize_part_size(size_t part_size) {
	if (part_size == 0 || part_size > b2::large_file_threshold) {
		return b2::large_file_threshold;
	}

	return part_size;
}

} // namespace

const std::error_category &
b2::writer_category() {
	const static error_category_t instance;
	return instance;
}

std::error_code
b2::make_error_code(writer_errc e) {
	return std::error_code(static_cast<int>(e), writer_category());
}

std::error_condition
b2::make_error_condition(writer_errc e) {
	return std::error_condition(static_cast<int>(e), writer_category());
}

b2::writer_error::writer_error(writer_errc e, const std::string &message)
	: std::system_error(make_error_code(e), message)
{
}

b2::writer_t::writer_t(ioremap::swarm::logger bh_logger_
		, std::shared_ptr<bucket_api_t> bucket_
		, cancellation_t cancellation_
		, std::string name_, std::string content_type_
		, file_info_t info_
		, writer_options_t options_)
	: state(state_tag::buffering)
	, bh_logger(std::move(bh_logger_))
	, bucket(std::move(bucket_))
	, parent_cancellation(std::move(cancellation_))
	, subscription(0)
	, name(std::move(name_))
	, content_type(std::move(content_type_))
	, info(std::move(info_))
	, options(std::move(options_))
	, buffer(normalize_part_size(options.part_size))
	, next_chunk_id(1)
	, close_called(false)
	, bytes_written(0)
	, parts_sealed(0)
	, start_time(std::chrono::system_clock::now())
{
	options.concurrent_uploads = std::max<size_t>(1, options.concurrent_uploads);
	options.part_size = buffer.get_capacity();

	{
		auto cancellation_ = cancellation;
		subscription = parent_cancellation.subscribe([cancellation_] () mutable {
			cancellation_.cancel();
		});
	}

	{
		std::ostringstream oss;
		oss
			<< "writing starts:"
			<< " key=" << get_key()
			<< " content-type=" << content_type
			<< " part-size=" << options.part_size
			<< " concurrent-uploads=" << options.concurrent_uploads
			<< " total-retries=" << options.total_retries;

		auto msg = oss.str();

		B2_LOG_INFO("%s", msg.c_str());
	}

	B2_FILE_START(bucket->get_name(), instance_id());
}

b2::writer_t::~writer_t() {
	switch (state.load()) {
	case state_tag::buffering:
	case state_tag::uploading_parts:
	case state_tag::closing:
		B2_LOG_WARNING("writer is destroyed without close: key=%s bytes-written=%llu"
				, get_key().c_str(), static_cast<unsigned long long>(bytes_written.load()));
		B2_FILE_DISCARD(bucket->get_name(), instance_id());
		break;
	case state_tag::closed:
	case state_tag::failed:
		break;
	}

	parent_cancellation.unsubscribe(subscription);

	// Wakes up workers stuck in remote calls, the pool joins them on destruction
	cancellation.cancel();
}

size_t
b2::writer_t::write(const char *data, size_t size) {
	switch (state.load()) {
	case state_tag::buffering:
	case state_tag::uploading_parts:
		break;
	case state_tag::failed:
		if (error) {
			std::rethrow_exception(error);
		}
		throw writer_error(writer_errc::failed);
	case state_tag::closing:
	case state_tag::closed:
		throw writer_error(writer_errc::unexpected_event, "write after close");
	}

	try {
		cancellation.check();

		size_t consumed = 0;

		while (consumed != size) {
			// A full buffer is sealed only when there is more data for it,
			// a file of exactly part_size bytes is still uploaded at once
			if (buffer.is_full()) {
				seal_chunk();
			}

			auto appended = buffer.append(data + consumed, size - consumed);
			consumed += appended;
			bytes_written += appended;
		}

		return consumed;
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("write failed: key=%s bytes-written=%llu error=\"%s\""
				, get_key().c_str(), static_cast<unsigned long long>(bytes_written.load())
				, ex.what());
		fail(std::current_exception());
		throw;
	}
}

void
b2::writer_t::close() {
	bool first_close = !close_called;
	close_called = true;

	auto previous_state = state.load();

	switch (previous_state) {
	case state_tag::buffering:
	case state_tag::uploading_parts:
		break;
	case state_tag::closed:
		return;
	case state_tag::failed:
		if (first_close && error) {
			std::rethrow_exception(error);
		}
		return;
	case state_tag::closing:
		throw writer_error(writer_errc::unexpected_event, "close is in progress");
	}

	state = state_tag::closing;

	try {
		cancellation.check();

		if (previous_state == state_tag::buffering) {
			close_simple();
		} else {
			close_large();
		}
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("close failed: key=%s bytes-written=%llu error=\"%s\""
				, get_key().c_str(), static_cast<unsigned long long>(bytes_written.load())
				, ex.what());
		fail(std::current_exception());
		throw;
	}

	state = state_tag::closed;

	auto spent_time = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now() - start_time).count();

	std::ostringstream oss;
	oss
		<< "writing is finished:"
		<< " key=" << get_key()
		<< " id=" << result->id
		<< " size=" << result->size
		<< " sha1=" << result->sha1
		<< " parts=" << parts_sealed
		<< " spent-time=" << spent_time << "ms";

	auto msg = oss.str();

	B2_LOG_INFO("%s", msg.c_str());
}

const b2::file_result_t &
b2::writer_t::get_result() const {
	if (state != state_tag::closed) {
		throw writer_error(writer_errc::unexpected_event, "writer is not closed");
	}

	return *result;
}

const std::string &
b2::writer_t::get_bucket_name() const {
	return bucket->get_name();
}

const std::string &
b2::writer_t::get_name() const {
	return name;
}

std::string
b2::writer_t::get_key() const {
	return bucket->get_name() + '/' + name;
}

b2::writer_info_t
b2::writer_t::get_info() const {
	writer_info_t writer_info;

	writer_info.bucket = get_bucket_name();
	writer_info.name = name;
	writer_info.key = get_key();
	writer_info.state = state_name(state);
	writer_info.bytes_written = bytes_written;
	writer_info.parts_sealed = parts_sealed;
	writer_info.parts_uploaded = 0;
	writer_info.part_retries = 0;
	writer_info.workers = 0;

	std::lock_guard<std::mutex> lock_guard(upload_worker_pool_mutex);
	(void) lock_guard;

	if (upload_worker_pool) {
		writer_info.parts_uploaded = upload_worker_pool->get_parts_uploaded();
		writer_info.part_retries = upload_worker_pool->get_part_retries();
		writer_info.workers = upload_worker_pool->get_workers_count();
	}

	return writer_info;
}

bool
b2::writer_t::is_closed() const {
	return state == state_tag::closed;
}

bool
b2::writer_t::is_failed() const {
	return state == state_tag::failed;
}

ioremap::swarm::logger &
b2::writer_t::logger() {
	return bh_logger;
}

void
b2::writer_t::seal_chunk() {
	if (state == state_tag::buffering) {
		start_large_file();
	}

	auto chunk = buffer.seal(next_chunk_id++);
	parts_sealed += 1;

	{
		std::ostringstream oss;
		oss
			<< "part is sealed:"
			<< " key=" << get_key()
			<< " large-file=" << large_file->get_id()
			<< " part=" << chunk.id
			<< " size=" << chunk.size
			<< " sha1=" << chunk.sha1;

		auto msg = oss.str();

		B2_LOG_DEBUG("%s", msg.c_str());
	}

	if (!upload_worker_pool->submit(std::move(chunk))) {
		std::rethrow_exception(upload_worker_pool->get_error());
	}
}

void
b2::writer_t::start_large_file() {
	large_file = bucket->start_large_file(cancellation, name, content_type, info);

	B2_LOG_INFO("large file is started: key=%s large-file=%s"
			, get_key().c_str(), large_file->get_id().c_str());

	std::unique_ptr<upload_worker_pool_t> pool(new upload_worker_pool_t(copy_logger(bh_logger)
				, bucket->get_name(), large_file, cancellation
				, options.concurrent_uploads, options.total_retries));
	pool->start();

	{
		std::lock_guard<std::mutex> lock_guard(upload_worker_pool_mutex);
		(void) lock_guard;

		upload_worker_pool = std::move(pool);
	}

	state = state_tag::uploading_parts;
}

void
b2::writer_t::close_simple() {
	auto upload_url = bucket->get_upload_url(cancellation);
	auto sha1 = buffer.get_sha1();

	B2_LOG_INFO("upload file: key=%s size=%llu sha1=%s"
			, get_key().c_str(), static_cast<unsigned long long>(buffer.get_size())
			, sha1.c_str());

	result = upload_url->upload_file(cancellation, buffer.data(), buffer.get_size()
			, name, content_type, sha1, info);

	B2_FILE_SIMPLE(bucket->get_name(), instance_id());
}

void
b2::writer_t::close_large() {
	if (!buffer.empty()) {
		seal_chunk();
	}

	upload_worker_pool->close();
	upload_worker_pool->join();

	if (auto pool_error = upload_worker_pool->get_error()) {
		std::rethrow_exception(pool_error);
	}

	// Workers leave quietly when cancelled while idle
	cancellation.check();

	B2_LOG_INFO("finish large file: key=%s large-file=%s parts=%llu"
			, get_key().c_str(), large_file->get_id().c_str()
			, static_cast<unsigned long long>(parts_sealed.load()));

	result = large_file->finish_large_file(cancellation);

	B2_FILE_LARGE(bucket->get_name(), instance_id());
}

void
b2::writer_t::fail(std::exception_ptr error_) {
	if (!error) {
		error = std::move(error_);
	}

	state = state_tag::failed;

	if (upload_worker_pool) {
		upload_worker_pool->cancel();
		upload_worker_pool->join();
	}

	B2_FILE_DISCARD(bucket->get_name(), instance_id());
}

uint64_t
b2::writer_t::instance_id() const {
	return reinterpret_cast<uint64_t>(this);
}

const char *
b2::writer_t::state_name(state_tag state) {
	switch (state) {
	case state_tag::buffering:
		return "buffering";
	case state_tag::uploading_parts:
		return "uploading-parts";
	case state_tag::closing:
		return "closing";
	case state_tag::closed:
		return "closed";
	case state_tag::failed:
		return "failed";
	default:
		return "unknown";
	}
}
