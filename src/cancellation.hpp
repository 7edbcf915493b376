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

#ifndef B2_UPLOADER__SRC__CANCELLATION__HPP
#define B2_UPLOADER__SRC__CANCELLATION__HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace b2 {

// Copies share the same state: cancelling one of them cancels all.
// Every remote call receives the token and is expected to fail promptly
// once it is cancelled.
class cancellation_t {
public:
	typedef std::function<void (void)> callback_t;
	typedef size_t subscription_t;

	cancellation_t();

	void
	cancel();

	bool
	is_cancelled() const;

	// Throws cancelled_error if the token was cancelled
	void
	check() const;

	// The callback runs once: immediately if the token is already cancelled,
	// otherwise on the thread that calls cancel()
	subscription_t
	subscribe(callback_t callback);

	void
	unsubscribe(subscription_t subscription);

private:
	struct state_t {
		state_t()
			: cancelled(false)
			, next_subscription(1)
		{}

		std::mutex mutex;
		bool cancelled;
		subscription_t next_subscription;
		std::map<subscription_t, callback_t> callbacks;
	};

	std::shared_ptr<state_t> state;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__CANCELLATION__HPP */

