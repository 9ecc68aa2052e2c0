// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SignalEvent.hxx"

/**
 * Listener for shutdown signals (SIGTERM, SIGINT, SIGQUIT).
 */
class ShutdownListener {
	SignalEvent term_event, int_event, quit_event;

	using Callback = BoundMethod<void()>;
	const Callback callback;

public:
	ShutdownListener(EventLoop &loop, Callback _callback) noexcept;

	~ShutdownListener() noexcept {
		Disable();
	}

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() noexcept {
		term_event.Enable();
		int_event.Enable();
		quit_event.Enable();
	}

	void Disable() noexcept {
		term_event.Disable();
		int_event.Disable();
		quit_event.Disable();
	}

private:
	void SignalCallback(int signo) noexcept;
};
