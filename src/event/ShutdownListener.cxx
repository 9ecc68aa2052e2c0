// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ShutdownListener.hxx"
#include "io/Logger.hxx"

#include <signal.h>
#include <unistd.h>

inline void
ShutdownListener::SignalCallback(int signo) noexcept
{
	LogFmt(2, "shutdown", "caught signal {}, shutting down (pid={})",
	       signo, (int)getpid());

	Disable();
	callback();
}

ShutdownListener::ShutdownListener(EventLoop &loop, Callback _callback) noexcept
	:term_event(loop, SIGTERM, BIND_THIS_METHOD(SignalCallback)),
	 int_event(loop, SIGINT, BIND_THIS_METHOD(SignalCallback)),
	 quit_event(loop, SIGQUIT, BIND_THIS_METHOD(SignalCallback)),
	 callback(_callback)
{
}
