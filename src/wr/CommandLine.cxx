// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"

#include <string_view>

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>
#include <string.h>

static void
PrintUsage()
{
	puts("usage: webrelay [options]\n\n"
	     "valid options:\n"
	     " -h, --help              help (this text)\n"
	     " -V, --version           show webrelay version\n"
	     " -v, --verbose           be more verbose\n"
	     " -q, --quiet             be quiet\n"
	     " -f, --config-file FILE  load this configuration file\n"
	     " -l, --listen HOST:PORT  listen on this address (default *:8080)\n"
	     " -w, --workers N         number of worker processes\n"
	     " -s, --set NAME=VALUE    tweak an internal variable, see manual for details\n"
	     "\n"
	     );
}

[[noreturn]] [[gnu::format(printf, 2, 3)]]
static void
arg_error(const char *argv0, const char *fmt, ...)
{
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(1);
}

static void
HandleSet(WrConfig &config,
	  const char *argv0, const char *p)
{
	const char *eq;

	eq = strchr(p, '=');
	if (eq == nullptr)
		arg_error(argv0, "No '=' found in --set argument");

	if (eq == p)
		arg_error(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::runtime_error &e) {
		arg_error(argv0, "Error while parsing \"--set %.*s\": %s",
			  (int)name.size(), name.data(), e.what());
	}
}

void
ParseCommandLine(WrCmdLine &cmdline, WrConfig &config,
		 int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"config-file", 1, nullptr, 'f'},
		{"listen", 1, nullptr, 'l'},
		{"workers", 1, nullptr, 'w'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;
	char *endptr;

	while (true) {
		int option_index = 0;

		int ret = getopt_long(argc, argv, "hVvqf:l:w:s:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("webrelay v%s\n", WEBRELAY_VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'f':
			cmdline.config_file = optarg;
			break;

		case 'l':
			if (*optarg == 0)
				arg_error(argv[0], "Empty listener address");

			config.listen.emplace_front(optarg);
			break;

		case 'w':
			config.num_workers = strtoul(optarg, &endptr, 10);
			if (endptr == optarg || *endptr != 0 ||
			    config.num_workers > 1024)
				arg_error(argv[0], "Invalid number of workers");
			break;

		case 's':
			HandleSet(config, argv[0], optarg);
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind < argc)
		arg_error(argv[0], "unrecognized argument: %s", argv[optind]);
}
