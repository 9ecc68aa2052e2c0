// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Listener.hxx"
#include "Instance.hxx"
#include "ProxyHandler.hxx"
#include "ProxyRequest.hxx"
#include "http/Status.hxx"
#include "io/Logger.hxx"
#include "system/Error.hxx"
#include "util/StringSplit.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <event2/buffer.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>

#include <exception>
#include <memory>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

struct AddrInfoDeleter {
	void operator()(struct addrinfo *ai) const noexcept {
		freeaddrinfo(ai);
	}
};

struct EvbufferDeleter {
	void operator()(struct evbuffer *buffer) const noexcept {
		evbuffer_free(buffer);
	}
};

/**
 * Split a listener address into host (empty for the wildcard) and
 * port.
 */
static std::pair<std::string, std::string>
SplitListenAddress(std::string_view address)
{
	if (address.empty())
		throw std::runtime_error("Empty listener address");

	if (address.front() == '[') {
		/* "[ipv6]:port" */
		const auto [host, rest] = Split(address.substr(1), ']');
		if (rest.data() == nullptr || !rest.starts_with(':') ||
		    rest.size() < 2)
			throw FmtRuntimeError("Malformed listener address: {}",
					      address);

		return {std::string{host}, std::string{rest.substr(1)}};
	}

	const auto [host, port] = SplitLast(address, ':');
	if (port.data() == nullptr)
		/* just a port number */
		return {std::string{}, std::string{address}};

	if (port.empty())
		throw FmtRuntimeError("Malformed listener address: {}",
				      address);

	if (host == "*"sv)
		return {std::string{}, std::string{port}};

	return {std::string{host}, std::string{port}};
}

static int
BindListenSocket(const struct addrinfo &ai)
{
	int fd = socket(ai.ai_family, ai.ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK,
			ai.ai_protocol);
	if (fd < 0)
		throw MakeErrno("Failed to create socket");

	const int one = 1;
	if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0 ||
	    bind(fd, ai.ai_addr, ai.ai_addrlen) < 0 ||
	    listen(fd, 256) < 0) {
		const int e = errno;
		close(fd);
		throw MakeErrno(e, "Failed to bind listener socket");
	}

	return fd;
}

static int
BindListenAddress(const char *address)
{
	const auto [host, port] = SplitListenAddress(address);

	struct addrinfo hints{};
	hints.ai_flags = AI_PASSIVE|AI_ADDRCONFIG;
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	struct addrinfo *ai;
	int result = getaddrinfo(host.empty() ? nullptr : host.c_str(),
				 port.c_str(), &hints, &ai);
	if (result != 0)
		throw FmtRuntimeError("Failed to resolve '{}': {}",
				      address, gai_strerror(result));

	const std::unique_ptr<struct addrinfo, AddrInfoDeleter> ai_holder(ai);

	/* the first address family which works wins; on Linux, the
	   IPv6 wildcard address accepts IPv4 connections as well */
	std::exception_ptr error;
	for (const auto *i = ai; i != nullptr; i = i->ai_next) {
		try {
			return BindListenSocket(*i);
		} catch (const std::system_error &) {
			error = std::current_exception();
		}
	}

	if (!error)
		throw FmtRuntimeError("No address for '{}'", address);

	try {
		std::rethrow_exception(error);
	} catch (const std::exception &) {
		std::throw_with_nested(FmtRuntimeError("Failed to listen on '{}'",
						       address));
	}
}

WrListener::WrListener(WrInstance &_instance, const char *address)
	:instance(_instance), fd(BindListenAddress(address))
{
	LogConcat(3, "listener", "listening on ", address);
}

WrListener::~WrListener() noexcept
{
	if (http != nullptr)
		/* this closes the socket */
		evhttp_free(http);
	else
		close(fd);
}

void
WrListener::AddEvent()
{
	if (http != nullptr)
		return;

	http = evhttp_new(instance.event_loop.Get());
	if (http == nullptr)
		throw std::runtime_error("evhttp_new() failed");

	/* never invent a Content-Type; the header pipeline decides */
	evhttp_set_default_content_type(http, nullptr);
	evhttp_set_allowed_methods(http, EVHTTP_REQ_GET|EVHTTP_REQ_HEAD);
	evhttp_set_gencb(http, RequestCallback, this);

	if (evhttp_accept_socket(http, fd) < 0) {
		evhttp_free(http);
		http = nullptr;
		throw std::runtime_error("evhttp_accept_socket() failed");
	}
}

[[gnu::pure]]
static std::string_view
GetRequestHeader(struct evkeyvalq *headers, const char *name) noexcept
{
	const char *value = evhttp_find_header(headers, name);
	return value != nullptr ? std::string_view{value} : std::string_view{};
}

void
WrListener::OnRequest(struct evhttp_request &req) noexcept
{
	const bool head = evhttp_request_get_command(&req) == EVHTTP_REQ_HEAD;
	const char *uri = evhttp_request_get_uri(&req);
	const struct evhttp_uri *parsed = evhttp_request_get_evhttp_uri(&req);

	const char *path = parsed != nullptr
		? evhttp_uri_get_path(parsed)
		: nullptr;
	if (path == nullptr || *path == 0)
		path = "/";

	const char *query = parsed != nullptr
		? evhttp_uri_get_query(parsed)
		: nullptr;

	auto *input_headers = evhttp_request_get_input_headers(&req);

	const ProxyRequest request{
		path,
		query != nullptr ? std::string_view{query} : std::string_view{},
		GetRequestHeader(input_headers, "Accept"),
		GetRequestHeader(input_headers, "Accept-Language"),
	};

	auto response = HandleRequest(request, instance.fetcher,
				      instance.config);

	auto *output_headers = evhttp_request_get_output_headers(&req);
	for (const auto &[name, value] : response.headers)
		if (evhttp_add_header(output_headers,
				      name.c_str(), value.c_str()) < 0)
			LogConcat(2, "listener", "Dropping malformed header '",
				  name, "'");

	const int status = int(response.status);
	LogFmt(4, "access", "{} {} {}", head ? "HEAD"sv : "GET"sv,
	       uri != nullptr ? uri : "", status);

	if (head) {
		evhttp_remove_header(output_headers, "Content-Length");
		evhttp_add_header(output_headers, "Content-Length",
				  std::to_string(response.body.size()).c_str());
		evhttp_send_reply(&req, status, nullptr, nullptr);
		return;
	}

	const std::unique_ptr<struct evbuffer, EvbufferDeleter> body(evbuffer_new());
	if (!body || evbuffer_add(body.get(), response.body.data(),
				  response.body.size()) < 0) {
		LogConcat(1, "listener", "Out of memory");
		evhttp_send_error(&req, int(HttpStatus::INTERNAL_SERVER_ERROR),
				  nullptr);
		return;
	}

	evhttp_send_reply(&req, status, nullptr, body.get());
}
