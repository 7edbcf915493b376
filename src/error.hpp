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

#ifndef B2_UPLOADER__SRC__ERROR__HPP
#define B2_UPLOADER__SRC__ERROR__HPP

#include <stdexcept>
#include <string>

namespace b2 {

class b2_error : public std::runtime_error
{
public:
	b2_error(const std::string &message)
		: std::runtime_error(message)
	{}
};

// Failure reported by the remote storage
class remote_error : public b2_error
{
public:
	remote_error(int status_, const std::string &message)
		: b2_error(message)
		, m_status(status_)
	{}

	int
	status() const {
		return m_status;
	}

	bool
	is_server_error() const {
		return m_status >= 500 && m_status <= 599;
	}

private:
	int m_status;
};

class authorization_error : public remote_error
{
public:
	authorization_error(const std::string &message)
		: remote_error(401, message)
	{}
};

class no_such_bucket_error : public b2_error
{
public:
	no_such_bucket_error(const std::string &bucket_name_)
		: b2_error(bucket_name_ + ": no such bucket")
		, m_bucket_name(bucket_name_)
	{}

	const std::string &
	bucket_name() const {
		return m_bucket_name;
	}

private:
	std::string m_bucket_name;
};

class cancelled_error : public b2_error
{
public:
	cancelled_error(const std::string &message = "operation was cancelled")
		: b2_error(message)
	{}
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__ERROR__HPP */

