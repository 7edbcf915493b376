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


#include <handystats/core.hpp>
#include <handystats/json_dump.hpp>

#include "server.hpp"
#include "upload.hpp"

#include <thevoid/rapidjson/stringbuffer.h>
#include <thevoid/rapidjson/writer.h>

#include <stdexcept>

b2::uploader_t::~uploader_t() {
	B2_LOG_INFO("B2-uploader stops");

	B2_LOG_INFO("B2-uploader stops: cancel uploads");
	m_cancellation.cancel();
	B2_LOG_INFO("B2-uploader stops: done");

	B2_LOG_INFO("B2-uploader stops: handystats");
	HANDY_FINALIZE();
	B2_LOG_INFO("B2-uploader stops: done");
}

bool b2::uploader_t::initialize(const rapidjson::Value &config) {
	try {
		B2_LOG_INFO("B2-uploader starts");

		B2_LOG_INFO("B2-uploader starts: read settings");
		settings = parse_settings(config);
		B2_LOG_INFO("B2-uploader starts: done");

		B2_LOG_INFO("B2-uploader starts: initialize storage");
		storage = std::make_shared<local_storage_t>(component_logger(logger(), "storage")
				, settings.storage);
		B2_LOG_INFO("B2-uploader starts: done");

		B2_LOG_INFO("B2-uploader starts: authorize account");
		m_client = client_t::authorize(component_logger(logger(), "client"), storage
				, m_cancellation, settings.account_id, settings.application_key);
		B2_LOG_INFO("B2-uploader starts: done");

		if (config.HasMember("handystats")) {
			HANDY_CONFIG_JSON(config["handystats"]);

			if (config["handystats"].HasMember("core") &&
					config["handystats"]["core"].HasMember("enable") &&
					config["handystats"]["core"]["enable"].IsBool() &&
					config["handystats"]["core"]["enable"].GetBool()
				)
			{
				HANDY_INIT();
			}
		}

	} catch(const std::exception &ex) {
		B2_LOG_ERROR("%s", ex.what());
		return false;
	}

	B2_LOG_INFO("B2-uploader starts: initialize handlers");

	register_handler<upload_t>("upload", false);
	register_handler<req_writers>("writers", true);
	register_handler<req_ping>("ping", true);
	register_handler<req_stats>("stats", true);

	B2_LOG_INFO("B2-uploader starts: done");
	B2_LOG_INFO("B2-uploader starts: initialization is done");

	return true;
}

const std::shared_ptr<b2::client_t> &
b2::uploader_t::client() const {
	return m_client;
}

const b2::writer_options_t &
b2::uploader_t::writer_options() const {
	return settings.writer_options;
}

const b2::cancellation_t &
b2::uploader_t::cancellation() const {
	return m_cancellation;
}

void b2::uploader_t::req_ping::on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer) {
	(void) req;
	(void) buffer;

	send_reply(200);
}

void b2::uploader_t::req_writers::on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer) {
	(void) buffer;

	try {
		auto writers = server()->client()->registry().snapshot();

		rapidjson::StringBuffer string_buffer;
		rapidjson::Writer<rapidjson::StringBuffer> writer(string_buffer);

		writer.StartArray();

		for (auto it = writers.begin(), end = writers.end(); it != end; ++it) {
			writer.StartObject();

			writer.String("bucket");
			writer.String(it->bucket.c_str());
			writer.String("name");
			writer.String(it->name.c_str());
			writer.String("key");
			writer.String(it->key.c_str());
			writer.String("state");
			writer.String(it->state.c_str());
			writer.String("bytes-written");
			writer.Uint64(it->bytes_written);
			writer.String("parts-sealed");
			writer.Uint64(it->parts_sealed);
			writer.String("parts-uploaded");
			writer.Uint64(it->parts_uploaded);
			writer.String("part-retries");
			writer.Uint64(it->part_retries);
			writer.String("workers");
			writer.Uint64(it->workers);

			writer.EndObject();
		}

		writer.EndArray();

		std::string json = string_buffer.GetString();

		ioremap::thevoid::http_response reply;
		ioremap::swarm::http_headers headers;

		reply.set_code(200);
		headers.set_content_length(json.size());
		headers.set_content_type("application/json");
		reply.set_headers(headers);

		B2_LOG_DEBUG("Writers: %s: %llu writers in flight", req.url().path().c_str()
				, static_cast<unsigned long long>(writers.size()));

		send_reply(std::move(reply), std::move(json));
	} catch (const std::exception &ex) {
		B2_LOG_ERROR("Writers request error: %s", ex.what());
		send_reply(500);
	}
}

void b2::uploader_t::req_stats::on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer) {
	(void) req;
	(void) buffer;

	std::string json = HANDY_JSON_DUMP();

	ioremap::thevoid::http_response reply;
	ioremap::swarm::http_headers headers;

	reply.set_code(200);
	headers.set_content_length(json.size());
	headers.set_content_type("application/json");
	reply.set_headers(headers);

	send_reply(std::move(reply), std::move(json));
}

int main(int argc, char **argv) {
	return ioremap::thevoid::run_server<b2::uploader_t>(argc, argv);
}
