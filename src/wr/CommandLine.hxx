// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct WrConfig;

struct WrCmdLine {
	const char *config_file = nullptr;
};

/**
 * Parse the command line into #cmdline and #config.  Prints a
 * message and exits the process on error.
 */
void
ParseCommandLine(WrCmdLine &cmdline, WrConfig &config,
		 int argc, char **argv);
