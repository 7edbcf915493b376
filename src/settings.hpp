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


#ifndef B2_UPLOADER__SRC__SETTINGS__HPP
#define B2_UPLOADER__SRC__SETTINGS__HPP

#include "local_storage.hpp"
#include "writer.hpp"

#include <thevoid/rapidjson/document.h>

#include <string>

namespace b2 {

struct settings_t {
	std::string account_id;
	std::string application_key;

	local_storage_config_t storage;
	writer_options_t writer_options;
};

// Reads the application section of the server config.
// Throws std::runtime_error if a mandatory value is missed.
settings_t
parse_settings(const rapidjson::Value &config);

} // namespace b2

#endif /* B2_UPLOADER__SRC__SETTINGS__HPP */

