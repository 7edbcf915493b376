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


#ifndef B2_UPLOADER__SRC__SERVER__HPP
#define B2_UPLOADER__SRC__SERVER__HPP

#include "loggers.hpp"
#include "client.hpp"
#include "settings.hpp"
#include "local_storage.hpp"
#include "cancellation.hpp"

#include <thevoid/server.hpp>

#include <memory>
#include <string>

namespace b2 {

class uploader_t : public ioremap::thevoid::server<uploader_t>
{
public:
	~uploader_t();

	bool initialize(const rapidjson::Value &config);

	struct req_ping
		: public ioremap::thevoid::simple_request_stream<uploader_t>
		, public std::enable_shared_from_this<req_ping>
	{
		void on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer);
	};

	struct req_writers
		: public ioremap::thevoid::simple_request_stream<uploader_t>
		, public std::enable_shared_from_this<req_writers>
	{
		void on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer);
	};

	struct req_stats
		: public ioremap::thevoid::simple_request_stream<uploader_t>
		, public std::enable_shared_from_this<req_stats>
	{
		void on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer);
	};

	template <typename T>
	void register_handler(const std::string &name, bool exact_match);

	const std::shared_ptr<client_t> &
	client() const;

	const writer_options_t &
	writer_options() const;

	// Cancelled on shutdown, every upload shares it
	const cancellation_t &
	cancellation() const;

private:
	settings_t settings;
	std::shared_ptr<local_storage_t> storage;
	std::shared_ptr<client_t> m_client;
	cancellation_t m_cancellation;
};

template <typename T>
void uploader_t::register_handler(const std::string &name, bool exact_match) {
	options opts;
	if (exact_match) {
		options::exact_match('/' + name)(&opts);
	} else {
		options::prefix_match('/' + name)(&opts);
	}

	base_server::on(std::move(opts), std::make_shared<ioremap::thevoid::stream_factory<uploader_t, T>>(this));
}

} // namespace b2

#endif /* B2_UPLOADER__SRC__SERVER__HPP */

