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

#ifndef B2_UPLOADER__SRC__CHANNEL__HPP
#define B2_UPLOADER__SRC__CHANNEL__HPP

#include <boost/optional.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>

namespace b2 {

/*
 * Unbuffered handoff between one producer and many consumers.
 * send() returns only after some consumer has taken the item, so the producer
 * cannot run ahead of the consumers.
 * Items given back by consumers through requeue() are kept in a separate queue
 * which is served before new items; requeue() never blocks.
 */
template <typename T>
class channel_t
{
public:
	channel_t()
		: closed(false)
		, cancelled(false)
		, sent(0)
		, received(0)
	{}

	// Returns false if the channel was closed or cancelled before the item
	// was taken
	bool
	send(T item) {
		lock_guard_t lock_guard(mutex);

		can_send.wait(lock_guard, [this] {
			return !slot || closed || cancelled;
		});

		if (closed || cancelled) {
			return false;
		}

		slot = std::move(item);
		auto ticket = ++sent;
		can_receive.notify_one();

		was_received.wait(lock_guard, [this, ticket] {
			return received >= ticket || cancelled;
		});

		if (received < ticket) {
			slot = boost::none;
			return false;
		}

		return true;
	}

	void
	requeue(T item) {
		lock_guard_t lock_guard(mutex);

		if (cancelled) {
			return;
		}

		retries.emplace_back(std::move(item));
		can_receive.notify_one();
	}

	// Blocks until there is an item; boost::none means the channel is either
	// cancelled or closed and drained
	boost::optional<T>
	receive() {
		lock_guard_t lock_guard(mutex);

		can_receive.wait(lock_guard, [this] {
			return cancelled || !retries.empty() || slot || closed;
		});

		if (cancelled) {
			return boost::none;
		}

		if (!retries.empty()) {
			boost::optional<T> item(std::move(retries.front()));
			retries.pop_front();
			return item;
		}

		if (slot) {
			boost::optional<T> item(std::move(*slot));
			slot = boost::none;
			++received;
			was_received.notify_all();
			can_send.notify_one();
			return item;
		}

		return boost::none;
	}

	// No more items will be sent; consumers drain what is left and stop
	void
	close() {
		lock_guard_t lock_guard(mutex);
		(void) lock_guard;

		closed = true;
		can_send.notify_all();
		can_receive.notify_all();
	}

	// Wakes everybody up, pending items are dropped
	void
	cancel() {
		lock_guard_t lock_guard(mutex);
		(void) lock_guard;

		cancelled = true;
		retries.clear();
		can_send.notify_all();
		can_receive.notify_all();
		was_received.notify_all();
	}

	bool
	is_cancelled() const {
		lock_guard_t lock_guard(mutex);
		(void) lock_guard;

		return cancelled;
	}

private:
	typedef std::mutex mutex_t;
	typedef std::unique_lock<mutex_t> lock_guard_t;

	mutable mutex_t mutex;
	std::condition_variable can_send;
	std::condition_variable can_receive;
	std::condition_variable was_received;

	bool closed;
	bool cancelled;

	size_t sent;
	size_t received;

	boost::optional<T> slot;
	std::deque<T> retries;
};

} // namespace b2

#endif /* B2_UPLOADER__SRC__CHANNEL__HPP */

