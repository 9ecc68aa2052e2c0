// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Worker process management.
 */

#include "Instance.hxx"
#include "io/Logger.hxx"

#include <sys/wait.h>
#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using std::chrono_literals::operator""s;

void
WrInstance::RespawnWorkerCallback() noexcept
{
	if (should_exit || workers.size() >= config.num_workers)
		return;

	while (workers.size() < config.num_workers) {
		const pid_t pid = SpawnWorker();
		if (pid == 0)
			/* we're the new worker */
			return;

		if (pid < 0) {
			ScheduleSpawnWorker();
			return;
		}
	}
}

void
WrInstance::ScheduleSpawnWorker() noexcept
{
	if (!should_exit && workers.size() < config.num_workers &&
	    !spawn_worker_event.IsPending())
		spawn_worker_event.Schedule(1s);
}

void
WrInstance::InitWorker()
{
	config.num_workers = 0;
	workers.clear();

	EnableListeners();
}

pid_t
WrInstance::SpawnWorker() noexcept
{
	pid_t pid = fork();
	if (pid < 0) {
		LogConcat(1, "worker", "fork() failed: ", strerror(errno));
	} else if (pid == 0) {
		try {
			event_loop.Reinit();
			InitWorker();
		} catch (const std::exception &e) {
			LogConcat(1, "worker", "Failed to initialize worker: ", e);
			_exit(EXIT_FAILURE);
		}
	} else {
		workers.insert(pid);
		LogConcat(3, "worker", "added worker ", (int)pid);
	}

	return pid;
}

void
WrInstance::KillAllWorkers() noexcept
{
	for (const pid_t pid : workers)
		if (kill(pid, SIGTERM) < 0)
			LogConcat(1, "worker", "failed to kill worker ",
				  (int)pid, ": ", strerror(errno));
}

void
WrInstance::OnSigchld(int) noexcept
{
	pid_t pid;
	int status;

	while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
		if (workers.erase(pid) == 0)
			continue;

		if (WIFSIGNALED(status))
			LogConcat(should_exit ? 3u : 1u, "worker", "worker ",
				  (int)pid, " died from signal ",
				  WTERMSIG(status));
		else if (WIFEXITED(status) && WEXITSTATUS(status) != 0)
			LogConcat(1, "worker", "worker ", (int)pid,
				  " exited with status ", WEXITSTATUS(status));
		else
			LogConcat(3, "worker", "worker ", (int)pid, " exited");

		/* a worker which exited on its own (outside of a
		   shutdown) is replaced */
		ScheduleSpawnWorker();
	}

	if (should_exit && workers.empty())
		sigchld_event.Disable();
}
