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


#ifndef B2_UPLOADER__SRC__LOCAL_STORAGE__HPP
#define B2_UPLOADER__SRC__LOCAL_STORAGE__HPP

#include "remote_api.hpp"

#include <swarm/logger.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace b2 {

struct local_storage_config_t {
	std::string root;
	std::string account_id;
	std::string application_key;
	std::vector<std::string> buckets;
};

/*
 * Storage backed by a local directory:
 *   ROOT/BUCKET/NAME          uploaded files, '/' and '%' in names are escaped,
 *                             as well as the names "." and ".."
 *   ROOT/.large-files/ID/N    parts of unfinished large files
 * Every file is written under a temporary name and renamed into place once
 * its size and sha1 are verified.
 */
class local_storage_t : public remote_api_t
{
public:
	local_storage_t(ioremap::swarm::logger bh_logger_, local_storage_config_t config_);

	std::shared_ptr<account_api_t>
	authorize_account(const cancellation_t &cancellation
			, const std::string &account_id, const std::string &application_key);

	struct context_t {
		context_t(ioremap::swarm::logger bh_logger_, local_storage_config_t config_)
			: bh_logger(std::move(bh_logger_))
			, config(std::move(config_))
			, next_id(0)
		{}

		std::string
		generate_id();

		ioremap::swarm::logger bh_logger;
		local_storage_config_t config;
		std::atomic<size_t> next_id;
	};

private:
	std::shared_ptr<context_t> context;
};

// Throws remote_error 400 for an empty name
std::string
escape_file_name(const std::string &name);

} // namespace b2

#endif /* B2_UPLOADER__SRC__LOCAL_STORAGE__HPP */

