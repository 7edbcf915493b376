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


#ifndef B2_UPLOADER__SRC__CLIENT__HPP
#define B2_UPLOADER__SRC__CLIENT__HPP

#include "remote_api.hpp"
#include "cancellation.hpp"
#include "writer.hpp"
#include "writer_registry.hpp"

#include <swarm/logger.hpp>

#include <memory>
#include <string>

namespace b2 {

class bucket_t
{
public:
	bucket_t(ioremap::swarm::logger bh_logger_, std::shared_ptr<bucket_api_t> bucket_api_);

	const std::string &
	get_name() const;

	std::shared_ptr<writer_t>
	new_writer(cancellation_t cancellation
			, std::string name, std::string content_type
			, file_info_t info = file_info_t()
			, writer_options_t options = writer_options_t()) const;

private:
	ioremap::swarm::logger bh_logger;
	std::shared_ptr<bucket_api_t> bucket_api;
};

// An authorized account. Owns the registry of writers started through it.
class client_t
{
public:
	static
	std::shared_ptr<client_t>
	authorize(ioremap::swarm::logger bh_logger
			, std::shared_ptr<remote_api_t> remote_api
			, const cancellation_t &cancellation
			, const std::string &account_id, const std::string &application_key);

	client_t(ioremap::swarm::logger bh_logger_, std::shared_ptr<account_api_t> account_api_);

	// Throws no_such_bucket_error if the account has no bucket with this name
	std::shared_ptr<bucket_t>
	bucket(const cancellation_t &cancellation, const std::string &name);

	writer_registry_t &
	registry();

private:
	ioremap::swarm::logger &
	logger();

	ioremap::swarm::logger bh_logger;
	std::shared_ptr<account_api_t> account_api;
	writer_registry_t writer_registry;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__CLIENT__HPP */

