// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Fetcher.hxx"
#include "Listener.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "event/SignalEvent.hxx"
#include "event/TimerEvent.hxx"

#include <forward_list>
#include <set>

#include <sys/types.h>

struct WrInstance {
	WrConfig config;

	EventLoop event_loop;

	CurlFetcher fetcher{config.fetch};

	std::forward_list<WrListener> listeners;

	bool should_exit = false;
	ShutdownListener shutdown_listener;
	SignalEvent sigchld_event;

	/* child management */
	TimerEvent spawn_worker_event;

	/**
	 * The process ids of all running worker processes.  Always
	 * empty in a worker.
	 */
	std::set<pid_t> workers;

	explicit WrInstance(WrConfig &&_config);
	~WrInstance() noexcept;

	WrInstance(const WrInstance &) = delete;
	WrInstance &operator=(const WrInstance &) = delete;

	void EnableSignals() noexcept;
	void DisableSignals() noexcept;

	/**
	 * Throws on error.
	 */
	void AddListener(const char *address);

	/**
	 * Throws on error.
	 */
	void EnableListeners();

	/**
	 * Transition the current process from "master" to "worker".
	 * Call this after forking in the new worker process.
	 */
	void InitWorker();

	/**
	 * Fork a new worker process.
	 *
	 * @return the child's pid in the master, 0 in the worker, -1
	 * on error
	 */
	pid_t SpawnWorker() noexcept;
	void ScheduleSpawnWorker() noexcept;
	void KillAllWorkers() noexcept;

private:
	void ShutdownCallback() noexcept;
	void OnSigchld(int signo) noexcept;
	void RespawnWorkerCallback() noexcept;
};
