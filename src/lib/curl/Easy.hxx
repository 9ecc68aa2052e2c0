// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::runtime_error on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");
	}

	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw Curl::MakeError(code, "Failed to set option");
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetErrorBuffer(char *buf) {
		SetOption(CURLOPT_ERRORBUFFER, buf);
	}

	void SetNoProgress(bool value=true) {
		SetOption(CURLOPT_NOPROGRESS, (long)value);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	void SetVerifyHost(bool value) {
		SetOption(CURLOPT_SSL_VERIFYHOST, value ? 2L : 0L);
	}

	void SetVerifyPeer(bool value) {
		SetOption(CURLOPT_SSL_VERIFYPEER, (long)value);
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, (long)timeout.count());
	}

	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetFollowLocation(bool value, long max_redirects) {
		SetOption(CURLOPT_FOLLOWLOCATION, (long)value);
		SetOption(CURLOPT_MAXREDIRS, max_redirects);
		SetOption(CURLOPT_AUTOREFERER, (long)value);
	}

	/**
	 * Announce all encodings supported by libcurl and decode the
	 * response body transparently.
	 */
	void SetAcceptAllEncodings() {
		SetOption(CURLOPT_ACCEPT_ENCODING, "");
	}

	void SetHeaderFunction(std::size_t (*function)(char *buffer, std::size_t size,
						       std::size_t nitems,
						       void *userdata),
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(std::size_t (*function)(char *ptr, std::size_t size,
						      std::size_t nmemb,
						      void *userdata),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	template<typename T>
	bool GetInfo(CURLINFO info, T value_r) const noexcept {
		return ::curl_easy_getinfo(handle, info, value_r) == CURLE_OK;
	}

	/**
	 * Returns the HTTP status of the last response, or -1 on
	 * error.
	 */
	[[gnu::pure]]
	long GetResponseCode() const noexcept {
		long value;
		return GetInfo(CURLINFO_RESPONSE_CODE, &value)
			? value
			: -1;
	}

	/**
	 * Returns the final URL after following redirects, or nullptr
	 * if that is unknown.
	 */
	[[gnu::pure]]
	const char *GetEffectiveURL() const noexcept {
		char *value;
		return GetInfo(CURLINFO_EFFECTIVE_URL, &value)
			? value
			: nullptr;
	}

	/**
	 * Returns the "Content-Type" of the final response, or nullptr
	 * if there was none.
	 */
	[[gnu::pure]]
	const char *GetContentType() const noexcept {
		char *value;
		return GetInfo(CURLINFO_CONTENT_TYPE, &value)
			? value
			: nullptr;
	}
};
