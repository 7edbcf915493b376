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

#include "upload_worker_pool.hpp"
#include "loggers.hpp"
#include "error.hpp"
#include "handystats.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>

namespace {

class error_category_t
	: public std::error_category
{
public:
	const char *
	name() const noexcept {
		return "upload worker pool error category";
	}

	std::string
	message(int ev) const {
		switch (static_cast<b2::upload_worker_pool_errc>(ev)) {
		case b2::upload_worker_pool_errc::success:
			return "success";
		case b2::upload_worker_pool_errc::retries_exhausted:
			return "retries of a part are exhausted";
		case b2::upload_worker_pool_errc::no_upload_part_url:
			return "no worker could get an upload part url";
		default:
			return "unknown error";
		}
	}
};

} // namespace

const std::error_category &
b2::upload_worker_pool_category() {
	const static error_category_t instance;
	return instance;
}

std::error_code
b2::make_error_code(upload_worker_pool_errc e) {
	return std::error_code(static_cast<int>(e), upload_worker_pool_category());
}

std::error_condition
b2::make_error_condition(upload_worker_pool_errc e) {
	return std::error_condition(static_cast<int>(e), upload_worker_pool_category());
}

b2::upload_worker_pool_error::upload_worker_pool_error(upload_worker_pool_errc e
		, const std::string &message)
	: std::system_error(make_error_code(e), message)
{
}

b2::upload_worker_pool_t::upload_worker_pool_t(ioremap::swarm::logger bh_logger_
		, std::string bucket_name_
		, std::shared_ptr<large_file_t> large_file_
		, cancellation_t cancellation_
		, size_t workers_count_, size_t total_retries_)
	: bh_logger(std::move(bh_logger_))
	, bucket_name(std::move(bucket_name_))
	, large_file(std::move(large_file_))
	, cancellation(std::move(cancellation_))
	, subscription(0)
	, workers_count(std::max<size_t>(1, workers_count_))
	, total_retries(total_retries_)
	, channel(std::make_shared<chunk_channel_t>())
	, workers_with_url(0)
	, parts_uploaded(0)
	, part_retries(0)
{
}

b2::upload_worker_pool_t::~upload_worker_pool_t() {
	cancel();
	join();
	cancellation.unsubscribe(subscription);
}

void
b2::upload_worker_pool_t::start() {
	{
		std::ostringstream oss;
		oss
			<< "upload workers start:"
			<< " bucket=" << bucket_name
			<< " large-file=" << large_file->get_id()
			<< " workers=" << workers_count
			<< " total-retries=" << total_retries;

		auto msg = oss.str();

		B2_LOG_INFO("%s", msg.c_str());
	}

	auto channel_ = channel;
	subscription = cancellation.subscribe([channel_] {
		channel_->cancel();
	});

	workers_with_url = workers_count;
	threads.reserve(workers_count);

	for (size_t index = 0; index != workers_count; ++index) {
		threads.emplace_back([this, index] {
			worker_t(*this, index).run();
		});
	}
}

bool
b2::upload_worker_pool_t::submit(chunk_t chunk) {
	size_t id = chunk.id;

	if (channel->send(std::move(chunk))) {
		return true;
	}

	// The channel is never closed while chunks are submitted, so it was cancelled
	fail(std::make_exception_ptr(cancelled_error("upload of parts was cancelled")));

	B2_LOG_ERROR("cannot submit part: bucket=%s large-file=%s part=%llu"
			, bucket_name.c_str(), large_file->get_id().c_str()
			, static_cast<unsigned long long>(id));
	return false;
}

void
b2::upload_worker_pool_t::close() {
	channel->close();
}

void
b2::upload_worker_pool_t::cancel() {
	channel->cancel();
}

void
b2::upload_worker_pool_t::join() {
	for (auto it = threads.begin(), end = threads.end(); it != end; ++it) {
		if (it->joinable()) {
			it->join();
		}
	}
}

std::exception_ptr
b2::upload_worker_pool_t::get_error() const {
	std::lock_guard<std::mutex> lock_guard(error_mutex);
	(void) lock_guard;

	return error;
}

size_t
b2::upload_worker_pool_t::get_workers_count() const {
	return workers_count;
}

size_t
b2::upload_worker_pool_t::get_parts_uploaded() const {
	return parts_uploaded;
}

size_t
b2::upload_worker_pool_t::get_part_retries() const {
	return part_retries;
}

ioremap::swarm::logger &
b2::upload_worker_pool_t::logger() {
	return bh_logger;
}

void
b2::upload_worker_pool_t::fail(std::exception_ptr error_) {
	{
		std::lock_guard<std::mutex> lock_guard(error_mutex);
		(void) lock_guard;

		if (!error) {
			error = std::move(error_);
		}
	}

	channel->cancel();
}

b2::upload_worker_pool_t::worker_t::worker_t(upload_worker_pool_t &pool_, size_t index_)
	: pool(pool_)
	, index(index_)
	, bh_logger(pool.logger(), blackhole::log::attributes_t({
				blackhole::attribute::make("worker", boost::lexical_cast<std::string>(index))}))
{
}

void
b2::upload_worker_pool_t::worker_t::run() {
	try {
		auto upload_part_url = get_upload_part_url();

		if (!upload_part_url) {
			return;
		}

		B2_LOG_INFO("worker starts: large-file=%s", pool.large_file->get_id().c_str());

		while (auto chunk = pool.channel->receive()) {
			upload(*upload_part_url, std::move(*chunk));
		}

		B2_LOG_INFO("worker stops: large-file=%s", pool.large_file->get_id().c_str());
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("worker failed: large-file=%s error=\"%s\""
				, pool.large_file->get_id().c_str(), ex.what());
		pool.fail(std::current_exception());
	}
}

ioremap::swarm::logger &
b2::upload_worker_pool_t::worker_t::logger() {
	return bh_logger;
}

std::shared_ptr<b2::upload_part_url_t>
b2::upload_worker_pool_t::worker_t::get_upload_part_url() {
	try {
		return pool.large_file->get_upload_part_url(pool.cancellation);
	} catch (const cancelled_error &) {
		pool.fail(std::current_exception());
		return std::shared_ptr<upload_part_url_t>();
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("cannot get upload part url: large-file=%s error=\"%s\""
				, pool.large_file->get_id().c_str(), ex.what());

		// The rest of workers can upload everything, the pool fails only
		// when nobody is left
		if (--pool.workers_with_url == 0) {
			pool.fail(std::make_exception_ptr(upload_worker_pool_error(
							upload_worker_pool_errc::no_upload_part_url, ex.what())));
		}

		return std::shared_ptr<upload_part_url_t>();
	}
}

void
b2::upload_worker_pool_t::worker_t::upload(upload_part_url_t &upload_part_url, chunk_t chunk) {
	auto start_time = std::chrono::system_clock::now();

	std::ostringstream oss;
	oss
		<< "upload part is finished:"
		<< " large-file=" << pool.large_file->get_id()
		<< " part=" << chunk.id
		<< " size=" << chunk.size
		<< " sha1=" << chunk.sha1
		<< " attempt=" << chunk.attempt;

	try {
		pool.cancellation.check();
		upload_part_url.upload_part(pool.cancellation
				, chunk.buffer.data(), chunk.sha1, chunk.size, chunk.id);
	} catch (const cancelled_error &) {
		oss << " status=\"cancelled\"";
		auto msg = oss.str();
		B2_LOG_INFO("%s", msg.c_str());

		pool.fail(std::current_exception());
		return;
	} catch (const std::exception &ex) {
		B2_PART_FAILED(pool.bucket_name);

		chunk.attempt += 1;
		pool.part_retries += 1;

		oss << " status=\"bad\" description=\"" << ex.what() << "\"";

		if (chunk.attempt > pool.total_retries) {
			oss << " decision=\"give up\"";
			auto msg = oss.str();
			B2_LOG_ERROR("%s", msg.c_str());

			std::ostringstream error_oss;
			error_oss
				<< "part " << chunk.id << " failed " << chunk.attempt
				<< " times, last error: " << ex.what();

			pool.fail(std::make_exception_ptr(upload_worker_pool_error(
							upload_worker_pool_errc::retries_exhausted, error_oss.str())));
			return;
		}

		oss << " decision=\"try again\"";
		auto msg = oss.str();
		B2_LOG_WARNING("%s", msg.c_str());

		pool.channel->requeue(std::move(chunk));
		return;
	}

	pool.parts_uploaded += 1;
	B2_PART_UPLOADED(pool.bucket_name);

	auto spent_time = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now() - start_time).count();

	oss << " spent-time=" << spent_time << "ms status=\"ok\"";
	auto msg = oss.str();
	B2_LOG_INFO("%s", msg.c_str());
}
