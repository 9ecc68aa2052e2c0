// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct evhttp;
struct evhttp_request;
struct WrInstance;

/**
 * Listener for incoming HTTP connections.  The socket is bound in
 * the constructor; connections are only accepted after
 * AddEvent(), which is called in the process which serves requests
 * (i.e. in each worker, not in the master).
 */
class WrListener {
	WrInstance &instance;

	int fd;

	struct evhttp *http = nullptr;

public:
	/**
	 * Throws on error.
	 *
	 * @param address "host:port", "[ipv6]:port", "*:port" or just
	 * a port number
	 */
	WrListener(WrInstance &_instance, const char *address);
	~WrListener() noexcept;

	WrListener(const WrListener &) = delete;
	WrListener &operator=(const WrListener &) = delete;

	/**
	 * Start accepting connections.  Throws on error.
	 */
	void AddEvent();

private:
	void OnRequest(struct evhttp_request &req) noexcept;

	static void RequestCallback(struct evhttp_request *req,
				    void *ctx) noexcept {
		auto &listener = *(WrListener *)ctx;
		listener.OnRequest(*req);
	}
};
