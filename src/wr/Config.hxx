// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <forward_list>
#include <string>
#include <string_view>

/**
 * Settings for requests to upstream servers.
 */
struct WrFetchConfig {
	std::chrono::seconds connect_timeout{20};

	/**
	 * Upper limit for the whole transfer, including redirects.
	 */
	std::chrono::seconds total_timeout{60};

	unsigned max_redirects = 10;

	/**
	 * Verify the upstream server's TLS certificate?  Disabled by
	 * default, so self-signed and misconfigured servers can be
	 * accessed; enable this for production use.
	 */
	bool verify_tls = false;

	std::string user_agent =
		"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
		"(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
};

/**
 * Configuration.
 */
struct WrConfig {
	/**
	 * Listener addresses in the form "host:port"; "*" is the
	 * wildcard host.
	 */
	std::forward_list<std::string> listen;

	/**
	 * The number of worker processes; 0 means the master process
	 * handles all requests itself.
	 */
	unsigned num_workers = 0;

	WrFetchConfig fetch;

	/**
	 * Wall-clock limit for handling one request (fetching and
	 * rewriting).
	 */
	std::chrono::seconds request_timeout{120};

	/**
	 * Route references which cannot be resolved ("data:",
	 * "mailto:", fragments) through the proxy link encoder anyway?
	 */
	bool rewrite_special_schemes = true;

	/**
	 * Include the exception message in "500 Internal Server Error"
	 * responses?
	 */
	bool verbose_response = false;

	static constexpr unsigned default_port = 8080;

	/**
	 * Handle one "set NAME=VALUE" setting.
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Apply defaults after all settings have been loaded.
	 */
	void Finish();
};

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(WrConfig &config, const char *path);
