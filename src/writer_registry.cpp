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


#include "writer_registry.hpp"

void
b2::writer_registry_t::add(std::shared_ptr<writer_t> writer) {
	lock_guard_t lock_guard(mutex);
	(void) lock_guard;

	if (!writers) {
		writers.reset(new writers_t);
	}

	auto key = writer->get_key();
	(*writers)[key] = std::move(writer);
}

void
b2::writer_registry_t::remove(const writer_t &writer) {
	lock_guard_t lock_guard(mutex);
	(void) lock_guard;

	if (!writers) {
		return;
	}

	writers->erase(writer.get_key());
}

std::vector<b2::writer_info_t>
b2::writer_registry_t::snapshot() const {
	std::vector<std::shared_ptr<writer_t>> current_writers;

	{
		lock_guard_t lock_guard(mutex);
		(void) lock_guard;

		if (!writers) {
			return std::vector<writer_info_t>();
		}

		current_writers.reserve(writers->size());

		for (auto it = writers->begin(), end = writers->end(); it != end; ++it) {
			current_writers.emplace_back(it->second);
		}
	}

	std::vector<writer_info_t> result;
	result.reserve(current_writers.size());

	for (auto it = current_writers.begin(), end = current_writers.end(); it != end; ++it) {
		result.emplace_back((*it)->get_info());
	}

	return result;
}

size_t
b2::writer_registry_t::size() const {
	lock_guard_t lock_guard(mutex);
	(void) lock_guard;

	if (!writers) {
		return 0;
	}

	return writers->size();
}
