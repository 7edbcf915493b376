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


#include "upload.hpp"
#include "error.hpp"

#include <thevoid/rapidjson/stringbuffer.h>
#include <thevoid/rapidjson/writer.h>

#include <boost/algorithm/string/predicate.hpp>

#include <sstream>

namespace {

const std::string upload_prefix = "/upload/";
const std::string info_header_prefix = "X-Bz-Info-";
const std::string default_content_type = "application/octet-stream";

// /upload/BUCKET/NAME, NAME may contain slashes
bool
parse_path(const std::string &path, std::string &bucket_name, std::string &name) {
	if (path.compare(0, upload_prefix.size(), upload_prefix) != 0) {
		return false;
	}

	auto bucket_end = path.find('/', upload_prefix.size());

	if (bucket_end == std::string::npos) {
		return false;
	}

	bucket_name = path.substr(upload_prefix.size(), bucket_end - upload_prefix.size());
	name = path.substr(bucket_end + 1);

	return !bucket_name.empty() && !name.empty();
}

b2::file_info_t
get_file_info(const ioremap::thevoid::http_request &http_request) {
	b2::file_info_t info;

	const auto &headers = http_request.headers().all();

	for (auto it = headers.begin(), end = headers.end(); it != end; ++it) {
		if (boost::algorithm::istarts_with(it->first, info_header_prefix)) {
			info[it->first.substr(info_header_prefix.size())] = it->second;
		}
	}

	return info;
}

} // namespace

b2::upload_t::upload_t()
	: subscription(0)
	, total_size(0)
	, received_size(0)
{
}

b2::upload_t::~upload_t() {
	server_cancellation.unsubscribe(subscription);
	release_writer();
}

void
b2::upload_t::on_request(const ioremap::thevoid::http_request &http_request) {
	if (const auto &arg = http_request.headers().content_length()) {
		total_size = *arg;
	} else {
		B2_LOG_INFO("missing Content-Length");
		send_reply(400);
		return;
	}

	if (total_size == 0) {
		B2_LOG_INFO("Content-Length must be greater than zero");
		send_reply(400);
		return;
	}

	std::string bucket_name;
	std::string name;

	if (!parse_path(http_request.url().path(), bucket_name, name)) {
		B2_LOG_INFO("cannot parse url: %s", http_request.url().path().c_str());
		send_reply(400);
		return;
	}

	auto content_type = default_content_type;

	if (auto content_type_opt = http_request.headers().content_type()) {
		content_type = *content_type_opt;
	}

	server_cancellation = server()->cancellation();

	{
		auto cancellation_ = cancellation;
		subscription = server_cancellation.subscribe([cancellation_] () mutable {
			cancellation_.cancel();
		});
	}

	client = server()->client();
	std::shared_ptr<bucket_t> bucket;

	try {
		bucket = client->bucket(cancellation, bucket_name);
	} catch (const no_such_bucket_error &ex) {
		B2_LOG_INFO("%s", ex.what());
		send_reply(404);
		return;
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("cannot get bucket: bucket=%s error=\"%s\"", bucket_name.c_str(), ex.what());
		send_reply(500);
		return;
	}

	{
		std::ostringstream oss;
		oss
			<< "upload starts:"
			<< " bucket=" << bucket_name
			<< " name=" << name
			<< " content-type=" << content_type
			<< " size=" << total_size;

		auto msg = oss.str();

		B2_LOG_INFO("%s", msg.c_str());
	}

	writer = bucket->new_writer(cancellation, name, content_type
			, get_file_info(http_request), server()->writer_options());
	client->registry().add(writer);

	try_next_chunk();
}

void
b2::upload_t::on_chunk(const boost::asio::const_buffer &buffer, unsigned int flags) {
	(void) flags;

	if (!writer) {
		return;
	}

	const char *buffer_data = boost::asio::buffer_cast<const char *>(buffer);
	const size_t buffer_size = boost::asio::buffer_size(buffer);

	try {
		writer->write(buffer_data, buffer_size);
		received_size += buffer_size;

		if (received_size < total_size) {
			try_next_chunk();
			return;
		}

		writer->close();
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("upload failed: key=%s received=%llu error=\"%s\""
				, writer->get_key().c_str(), static_cast<unsigned long long>(received_size)
				, ex.what());
		send_error(500);
		return;
	}

	send_result();
}

// Only socket read errors get here, the client has gone and nobody waits for a reply
void
b2::upload_t::on_error(const boost::system::error_code &error_code) {
	B2_LOG_ERROR("error during reading request: %s", error_code.message().c_str());

	cancellation.cancel();
	release_writer();

	close(boost::system::error_code());
}

void
b2::upload_t::send_result() {
	const auto &result = writer->get_result();

	rapidjson::StringBuffer string_buffer;
	rapidjson::Writer<rapidjson::StringBuffer> json_writer(string_buffer);

	json_writer.StartObject();
	json_writer.String("bucket");
	json_writer.String(writer->get_bucket_name().c_str());
	json_writer.String("file");
	json_writer.String(result.name.c_str());
	json_writer.String("id");
	json_writer.String(result.id.c_str());
	json_writer.String("size");
	json_writer.Uint64(result.size);
	json_writer.String("sha1");
	json_writer.String(result.sha1.c_str());
	json_writer.EndObject();

	std::string res_str = string_buffer.GetString();

	release_writer();

	ioremap::thevoid::http_response reply;
	ioremap::swarm::http_headers headers;

	reply.set_code(200);
	headers.set_content_length(res_str.size());
	headers.set_content_type("application/json");
	reply.set_headers(headers);

	send_reply(std::move(reply), std::move(res_str));
}

void
b2::upload_t::send_error(int code) {
	cancellation.cancel();
	release_writer();
	send_reply(code);
}

void
b2::upload_t::release_writer() {
	if (!writer) {
		return;
	}

	client->registry().remove(*writer);
	writer.reset();
}
