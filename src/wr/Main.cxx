// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"
#include "lib/curl/Init.hxx"

#include <signal.h>
#include <stdlib.h>

using std::chrono_literals::operator""ms;

int
main(int argc, char **argv)
try {
	WrConfig config;
	WrCmdLine cmdline;

	ParseCommandLine(cmdline, config, argc, argv);

	if (cmdline.config_file != nullptr)
		LoadConfigFile(config, cmdline.config_file);

	config.Finish();

	/* a client closing its connection early must not kill us */
	signal(SIGPIPE, SIG_IGN);

	const ScopeCurlInit curl_init;

	WrInstance instance(std::move(config));

	for (const auto &address : instance.config.listen)
		instance.AddListener(address.c_str());

	instance.EnableSignals();

	if (instance.config.num_workers > 0) {
		/* the master process doesn't serve requests; spawn the
		   first workers really soon */
		instance.spawn_worker_event.Schedule(10ms);
	} else {
		instance.InitWorker();
	}

	/* main loop */

	instance.event_loop.Dispatch();

	LogConcat(3, "main", "exiting");
	return EXIT_SUCCESS;
} catch (const std::exception &e) {
	LogConcat(1, "main", e);
	return EXIT_FAILURE;
}
