// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"
#include "util/BindMethod.hxx"

/**
 * Invoke a callback each time the given signal is caught.  The
 * signal is delivered through the #EventLoop, i.e. the callback runs
 * in the normal loop context, not in a signal handler.
 */
class SignalEvent {
	Event event;

	using Callback = BoundMethod<void(int)>;
	const Callback callback;

public:
	SignalEvent(EventLoop &loop, int signo, Callback _callback) noexcept
		:event(loop, signo, EV_SIGNAL|EV_PERSIST, EventCallback, this),
		 callback(_callback) {}

	void Enable() noexcept {
		event.Add();
	}

	void Disable() noexcept {
		event.Delete();
	}

private:
	static void EventCallback(evutil_socket_t fd, short, void *ctx) noexcept {
		auto &event = *(SignalEvent *)ctx;
		event.callback(int(fd));
	}
};
