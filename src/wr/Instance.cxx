// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "io/Logger.hxx"

#include <signal.h>

WrInstance::WrInstance(WrConfig &&_config)
	:config(std::move(_config)),
	 shutdown_listener(event_loop, BIND_THIS_METHOD(ShutdownCallback)),
	 sigchld_event(event_loop, SIGCHLD, BIND_THIS_METHOD(OnSigchld)),
	 spawn_worker_event(event_loop,
			    BIND_THIS_METHOD(RespawnWorkerCallback))
{
}

WrInstance::~WrInstance() noexcept
{
	/* the listeners use the EventLoop; free them first */
	listeners.clear();
}

void
WrInstance::EnableSignals() noexcept
{
	shutdown_listener.Enable();
	sigchld_event.Enable();
}

void
WrInstance::DisableSignals() noexcept
{
	shutdown_listener.Disable();
	sigchld_event.Disable();
}

void
WrInstance::AddListener(const char *address)
{
	listeners.emplace_front(*this, address);
}

void
WrInstance::EnableListeners()
{
	for (auto &listener : listeners)
		listener.AddEvent();
}

void
WrInstance::ShutdownCallback() noexcept
{
	if (should_exit)
		return;

	should_exit = true;

	shutdown_listener.Disable();
	spawn_worker_event.Cancel();

	listeners.clear();

	KillAllWorkers();

	/* keep reaping workers until all are gone; after that, no
	   event remains and the loop returns */
	if (workers.empty())
		sigchld_event.Disable();
}
