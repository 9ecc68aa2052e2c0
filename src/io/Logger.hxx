// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * Messages with a level above this one are discarded.  0 means
 * "quiet", 1 shows only errors.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
CheckLogLevel(unsigned level) noexcept;

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogVFmt(level, domain, format_str,
		fmt::make_format_args(args...));
}

namespace LoggerDetail {

void
AppendLogArg(std::string &dest, std::exception_ptr ep) noexcept;

void
AppendLogArg(std::string &dest, const std::exception &e) noexcept;

inline void
AppendLogArg(std::string &dest, std::string_view s) noexcept
{
	dest.append(s);
}

inline void
AppendLogArg(std::string &dest, const char *s) noexcept
{
	dest.append(s != nullptr ? s : "(null)");
}

template<typename T>
requires std::is_arithmetic_v<T>
inline void
AppendLogArg(std::string &dest, T value) noexcept
{
	fmt::format_to(std::back_inserter(dest), "{}", value);
}

} // namespace LoggerDetail

/**
 * Concatenate all arguments (strings, numbers and exceptions) and
 * log the result.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain,
	  const Args&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	std::string msg;
	(LoggerDetail::AppendLogArg(msg, args), ...);
	LogString(level, domain, msg);
}

/**
 * A logger which prefixes all messages with a fixed domain name.
 */
class Logger {
	std::string_view domain;

public:
	explicit constexpr Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level, const Args&... args) const noexcept {
		LogConcat(level, domain, args...);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str,
		       std::forward<Args>(args)...);
	}
};
