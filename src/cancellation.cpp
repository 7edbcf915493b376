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

#include "cancellation.hpp"
#include "error.hpp"

b2::cancellation_t::cancellation_t()
	: state(std::make_shared<state_t>())
{
}

void
b2::cancellation_t::cancel() {
	std::map<subscription_t, callback_t> callbacks;

	{
		std::lock_guard<std::mutex> lock_guard(state->mutex);
		(void) lock_guard;

		if (state->cancelled) {
			return;
		}

		state->cancelled = true;
		callbacks.swap(state->callbacks);
	}

	// Callbacks are called without the lock, so they may use the token
	for (auto it = callbacks.begin(), end = callbacks.end(); it != end; ++it) {
		it->second();
	}
}

bool
b2::cancellation_t::is_cancelled() const {
	std::lock_guard<std::mutex> lock_guard(state->mutex);
	(void) lock_guard;

	return state->cancelled;
}

void
b2::cancellation_t::check() const {
	if (is_cancelled()) {
		throw cancelled_error();
	}
}

b2::cancellation_t::subscription_t
b2::cancellation_t::subscribe(callback_t callback) {
	{
		std::lock_guard<std::mutex> lock_guard(state->mutex);
		(void) lock_guard;

		if (!state->cancelled) {
			auto subscription = state->next_subscription++;
			state->callbacks.insert(std::make_pair(subscription, std::move(callback)));
			return subscription;
		}
	}

	callback();
	return 0;
}

void
b2::cancellation_t::unsubscribe(subscription_t subscription) {
	std::lock_guard<std::mutex> lock_guard(state->mutex);
	(void) lock_guard;

	state->callbacks.erase(subscription);
}
