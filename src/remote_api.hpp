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

#ifndef B2_UPLOADER__SRC__REMOTE_API__HPP
#define B2_UPLOADER__SRC__REMOTE_API__HPP

#include "cancellation.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Contract of the remote storage service. Implementations report failures by
// throwing exceptions derived from b2::b2_error and must honour the
// cancellation token passed to every call.

namespace b2 {

// Files and parts are capped by this size, larger files must be uploaded in parts
const size_t large_file_threshold = 100000000;

typedef std::map<std::string, std::string> file_info_t;

struct file_result_t {
	std::string id;
	std::string name;
	size_t size;
	std::string sha1;
};

struct part_result_t {
	std::string file_id;
	size_t part_id;
	size_t size;
	std::string sha1;
};

class upload_url_t
{
public:
	virtual ~upload_url_t() {}

	virtual file_result_t
	upload_file(const cancellation_t &cancellation
			, const char *data, size_t size
			, const std::string &name, const std::string &content_type
			, const std::string &sha1, const file_info_t &info) = 0;
};

class upload_part_url_t
{
public:
	virtual ~upload_part_url_t() {}

	virtual part_result_t
	upload_part(const cancellation_t &cancellation
			, const char *data, const std::string &sha1, size_t size, size_t part_id) = 0;
};

// A started large file, the multi-part session of the remote storage
class large_file_t
{
public:
	virtual ~large_file_t() {}

	virtual const std::string &
	get_id() const = 0;

	// Every uploading thread asks for its own url
	virtual std::shared_ptr<upload_part_url_t>
	get_upload_part_url(const cancellation_t &cancellation) = 0;

	virtual file_result_t
	finish_large_file(const cancellation_t &cancellation) = 0;
};

class bucket_api_t
{
public:
	virtual ~bucket_api_t() {}

	virtual const std::string &
	get_name() const = 0;

	virtual std::shared_ptr<upload_url_t>
	get_upload_url(const cancellation_t &cancellation) = 0;

	virtual std::shared_ptr<large_file_t>
	start_large_file(const cancellation_t &cancellation
			, const std::string &name, const std::string &content_type
			, const file_info_t &info) = 0;
};

class account_api_t
{
public:
	virtual ~account_api_t() {}

	virtual std::vector<std::shared_ptr<bucket_api_t>>
	list_buckets(const cancellation_t &cancellation) = 0;
};

class remote_api_t
{
public:
	virtual ~remote_api_t() {}

	virtual std::shared_ptr<account_api_t>
	authorize_account(const cancellation_t &cancellation
			, const std::string &account_id, const std::string &application_key) = 0;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__REMOTE_API__HPP */

