// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"
#include "util/BindMethod.hxx"

#include <chrono>

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent {
	Event event;

	const BoundMethod<void()> callback;

public:
	TimerEvent(EventLoop &loop, BoundMethod<void()> _callback) noexcept
		:event(loop, -1, 0, Callback, this), callback(_callback) {}

	bool IsPending() const noexcept {
		return event.IsPending(EV_TIMEOUT);
	}

	void Schedule(std::chrono::steady_clock::duration d) noexcept {
		const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
		const struct timeval tv{
			time_t(us / 1000000),
			suseconds_t(us % 1000000),
		};
		event.Add(tv);
	}

	void Cancel() noexcept {
		event.Delete();
	}

private:
	static void Callback(evutil_socket_t, short, void *ctx) noexcept {
		auto &event = *(TimerEvent *)ctx;
		event.callback();
	}
};
