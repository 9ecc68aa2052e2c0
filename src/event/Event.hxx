// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Loop.hxx"

#include <event2/event.h>
#include <event2/event_struct.h>

/**
 * Wrapper for a struct event.
 */
class Event {
	struct event event;

public:
	Event(EventLoop &loop, evutil_socket_t fd, short mask,
	      event_callback_fn callback, void *ctx) noexcept {
		::event_assign(&event, loop.Get(), fd, mask, callback, ctx);
	}

	~Event() noexcept {
		Delete();
	}

	Event(const Event &other) = delete;
	Event &operator=(const Event &other) = delete;

	bool Add(const struct timeval *timeout=nullptr) noexcept {
		return ::event_add(&event, timeout) == 0;
	}

	bool Add(const struct timeval &timeout) noexcept {
		return Add(&timeout);
	}

	void Delete() noexcept {
		::event_del(&event);
	}

	[[gnu::pure]]
	bool IsPending(short events) const noexcept {
		return ::event_pending(&event, events, nullptr);
	}
};
