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


#ifndef B2_UPLOADER__SRC__UPLOAD__HPP
#define B2_UPLOADER__SRC__UPLOAD__HPP

#include "server.hpp"
#include "writer.hpp"
#include "cancellation.hpp"

#include <thevoid/stream.hpp>

#include <memory>
#include <string>

namespace b2 {

// PUT /upload/BUCKET/NAME
// The body is streamed into a writer, the file is finished once Content-Length
// bytes are received. Writer calls block the io thread.
class upload_t
	: public ioremap::thevoid::buffered_request_stream<uploader_t>
	, public std::enable_shared_from_this<upload_t>
{
public:
	upload_t();

	~upload_t();

	void
	on_request(const ioremap::thevoid::http_request &http_request);

	void
	on_chunk(const boost::asio::const_buffer &buffer, unsigned int flags);

	void
	on_error(const boost::system::error_code &error_code);

private:
	void
	send_result();

	void
	send_error(int code);

	void
	release_writer();

	// The upload is cancelled together with the server
	cancellation_t cancellation;
	cancellation_t server_cancellation;
	cancellation_t::subscription_t subscription;

	std::shared_ptr<client_t> client;
	std::shared_ptr<writer_t> writer;

	size_t total_size;
	size_t received_size;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__UPLOAD__HPP */

