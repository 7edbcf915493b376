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


#include "settings.hpp"

#include <cstdint>
#include <stdexcept>

namespace {

// Negative values are clamped to 0
uint64_t get_uint64(const rapidjson::Value &config, const char *section, const char *name, uint64_t def_val = 0) {
	if (config.HasMember(name) == false) {
		return def_val;
	}

	const auto &value = config[name];

	if (value.IsUint64()) {
		return value.GetUint64();
	}

	if (value.IsInt64()) {
		return 0;
	}

	throw std::runtime_error(std::string("\"") + section + "/" + name + "\" must be an integer");
}

std::string get_string(const rapidjson::Value &config, const char *name, const std::string &def_val = std::string()) {
	return config.HasMember(name) ? config[name].GetString() : def_val;
}

const rapidjson::Value &
get_section(const rapidjson::Value &config, const char *name) {
	if (config.HasMember(name) == false) {
		throw std::runtime_error(std::string("You should set \"") + name + "\" section");
	}

	const auto &section = config[name];

	if (section.IsObject() == false) {
		throw std::runtime_error(std::string("\"") + name + "\" must be an object");
	}

	return section;
}

std::string
get_mandatory_string(const rapidjson::Value &config, const char *section, const char *name) {
	if (config.HasMember(name) == false || config[name].IsString() == false) {
		throw std::runtime_error(std::string("You should set \"") + section + "/" + name + "\"");
	}

	return config[name].GetString();
}

} // namespace

b2::settings_t
b2::parse_settings(const rapidjson::Value &config) {
	settings_t settings;

	{
		const auto &json_account = get_section(config, "account");

		settings.account_id = get_mandatory_string(json_account, "account", "id");
		settings.application_key = get_mandatory_string(json_account, "account", "key");
	}

	{
		const auto &json_storage = get_section(config, "storage");

		settings.storage.root = get_mandatory_string(json_storage, "storage", "root");
		settings.storage.account_id = get_string(json_storage, "account-id"
				, settings.account_id);
		settings.storage.application_key = get_string(json_storage, "application-key"
				, settings.application_key);

		if (json_storage.HasMember("buckets")) {
			const auto &json_buckets = json_storage["buckets"];

			if (json_buckets.IsArray() == false) {
				throw std::runtime_error("\"storage/buckets\" must be an array of names");
			}

			for (auto it = json_buckets.Begin(); it != json_buckets.End(); ++it) {
				if (it->IsString() == false) {
					throw std::runtime_error("\"storage/buckets\" must be an array of names");
				}

				settings.storage.buckets.emplace_back(it->GetString());
			}
		}
	}

	if (config.HasMember("writer")) {
		const auto &json_writer = get_section(config, "writer");
		auto &options = settings.writer_options;

		options.concurrent_uploads = get_uint64(json_writer, "writer", "concurrent-uploads"
				, options.concurrent_uploads);
		options.total_retries = get_uint64(json_writer, "writer", "total-retries"
				, options.total_retries);
	}

	return settings;
}
