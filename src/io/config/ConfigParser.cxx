// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>

#include <stdio.h>

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

static void
ParseConfigFile(const char *path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (const std::exception &) {
			std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
							       path, i));
		}

		++i;
	}
}

void
ParseConfigFile(const char *path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, FileCloser> file{fopen(path, "r")};
	if (!file)
		throw FmtRuntimeError("Failed to open {}: {}",
				      path, std::strerror(errno));

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}
