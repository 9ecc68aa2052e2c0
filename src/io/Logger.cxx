// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <iterator>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= log_level;
}

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept
{
	if (!CheckLogLevel(level))
		return;

	/* a single fwrite() per line, so lines from worker processes
	   sharing stderr don't get mixed up */
	fmt::memory_buffer buffer;
	if (!domain.empty())
		fmt::format_to(std::back_inserter(buffer), "[{}] ", domain);
	buffer.append(msg);
	buffer.push_back('\n');

	fwrite(buffer.data(), 1, buffer.size(), stderr);
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	LogString(level, domain, {buffer.data(), buffer.size()});
} catch (const fmt::format_error &e) {
	LogString(level, domain, e.what());
}

namespace LoggerDetail {

void
AppendLogArg(std::string &dest, std::exception_ptr ep) noexcept
{
	dest.append(GetFullMessage(ep));
}

void
AppendLogArg(std::string &dest, const std::exception &e) noexcept
{
	dest.append(GetFullMessage(e));
}

} // namespace LoggerDetail
