// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "util/StringAPI.hxx"

class WrConfigParser final : public ConfigParser {
	WrConfig &config;

public:
	explicit WrConfigParser(WrConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

void
WrConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "listen")) {
		config.listen.emplace_front(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "workers")) {
		config.num_workers = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "set")) {
		const char *name = line.ExpectWordAndSymbol('=',
							    "Variable name expected",
							    "'=' expected");
		const char *value = line.IsEnd()
			? ""
			: line.ExpectValueAndEnd();
		config.HandleSet(name, value);
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(WrConfig &config, const char *path)
{
	WrConfigParser parser(config);
	CommentConfigParser parser2(parser);

	ParseConfigFile(path, parser2);
}
