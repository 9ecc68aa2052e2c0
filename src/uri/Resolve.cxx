// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolve.hxx"
#include "AbsoluteUrl.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <array>
#include <vector>

using std::string_view_literals::operator""sv;

static constexpr std::array unresolvable_prefixes{
	"http://"sv,
	"https://"sv,
	"data:"sv,
	"blob:"sv,
	"mailto:"sv,
	"javascript:"sv,
};

bool
IsUnresolvableReference(std::string_view reference) noexcept
{
	if (reference.starts_with('#'))
		return true;

	for (const auto prefix : unresolvable_prefixes)
		if (StringStartsWithIgnoreCase(reference, prefix))
			return true;

	return false;
}

std::string
NormalizeUriPath(std::string_view path) noexcept
{
	std::vector<std::string_view> segments;
	bool trailing_slash = false;

	while (!path.empty()) {
		std::string_view segment;
		if (const auto slash = path.find('/'); slash != path.npos) {
			segment = path.substr(0, slash);
			path = path.substr(slash + 1);
			trailing_slash = path.empty();
		} else {
			segment = path;
			path = {};
			trailing_slash = false;
		}

		if (segment.empty())
			continue;

		if (segment == "."sv) {
			trailing_slash = true;
			continue;
		}

		if (segment == ".."sv) {
			/* popping past the root is a no-op */
			if (!segments.empty())
				segments.pop_back();
			trailing_slash = true;
			continue;
		}

		segments.push_back(segment);
	}

	std::string result;
	for (const auto segment : segments) {
		result.push_back('/');
		result += segment;
	}

	if (result.empty() || trailing_slash)
		result.push_back('/');

	return result;
}

/**
 * Return the "directory" part of a path, i.e. everything up to and
 * including the last slash.
 */
[[gnu::pure]]
static std::string_view
UriPathDirectory(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	if (slash == path.npos)
		return "/"sv;

	return path.substr(0, slash + 1);
}

std::string
ResolveUri(std::string_view reference, std::string_view base) noexcept
{
	reference = Strip(reference);

	if (IsUnresolvableReference(reference))
		return std::string{reference};

	const auto base_url = AbsoluteUrl::Parse(base);
	if (!base_url)
		/* can't resolve without a valid base */
		return std::string{reference};

	if (reference.starts_with("//"sv)) {
		/* scheme-relative */
		std::string result = base_url->scheme;
		result.push_back(':');
		result += reference;
		return result;
	}

	/* split off the fragment and the query string; they are
	   appended to the normalized path unmodified */

	std::string_view suffix{};
	if (const auto i = reference.find_first_of("?#"sv); i != reference.npos) {
		suffix = reference.substr(i);
		reference = reference.substr(0, i);
	}

	std::string path;
	std::string base_query;
	if (reference.starts_with('/')) {
		/* root-relative */
		path = reference;
	} else if (reference.empty()) {
		/* an empty reference or only a query string: keep
		   the whole base path; an empty reference also keeps
		   the base query string */
		path = base_url->path;

		if (suffix.empty() && base_url->has_query) {
			base_query.push_back('?');
			base_query += base_url->query;
			suffix = base_query;
		}
	} else {
		/* document-relative */
		path = UriPathDirectory(base_url->path);
		path += reference;
	}

	std::string result = base_url->GetOrigin();
	result += NormalizeUriPath(path);
	result += suffix;
	return result;
}
