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


#include "client.hpp"
#include "loggers.hpp"
#include "error.hpp"

b2::bucket_t::bucket_t(ioremap::swarm::logger bh_logger_
		, std::shared_ptr<bucket_api_t> bucket_api_)
	: bh_logger(std::move(bh_logger_))
	, bucket_api(std::move(bucket_api_))
{
}

const std::string &
b2::bucket_t::get_name() const {
	return bucket_api->get_name();
}

std::shared_ptr<b2::writer_t>
b2::bucket_t::new_writer(cancellation_t cancellation
		, std::string name, std::string content_type
		, file_info_t info, writer_options_t options) const {
	return std::make_shared<writer_t>(copy_logger(bh_logger), bucket_api
			, std::move(cancellation), std::move(name), std::move(content_type)
			, std::move(info), std::move(options));
}

std::shared_ptr<b2::client_t>
b2::client_t::authorize(ioremap::swarm::logger bh_logger
		, std::shared_ptr<remote_api_t> remote_api
		, const cancellation_t &cancellation
		, const std::string &account_id, const std::string &application_key) {
	auto account_api = remote_api->authorize_account(cancellation, account_id, application_key);

	BH_LOG(bh_logger, SWARM_LOG_INFO, "account is authorized: account-id=%s"
			, account_id.c_str());

	return std::make_shared<client_t>(std::move(bh_logger), std::move(account_api));
}

b2::client_t::client_t(ioremap::swarm::logger bh_logger_
		, std::shared_ptr<account_api_t> account_api_)
	: bh_logger(std::move(bh_logger_))
	, account_api(std::move(account_api_))
{
}

std::shared_ptr<b2::bucket_t>
b2::client_t::bucket(const cancellation_t &cancellation, const std::string &name) {
	auto buckets = account_api->list_buckets(cancellation);

	for (auto it = buckets.begin(), end = buckets.end(); it != end; ++it) {
		if ((*it)->get_name() == name) {
			return std::make_shared<bucket_t>(copy_logger(bh_logger), *it);
		}
	}

	B2_LOG_INFO("bucket is not found: bucket=%s", name.c_str());
	throw no_such_bucket_error(name);
}

b2::writer_registry_t &
b2::client_t::registry() {
	return writer_registry;
}

ioremap::swarm::logger &
b2::client_t::logger() {
	return bh_logger;
}
