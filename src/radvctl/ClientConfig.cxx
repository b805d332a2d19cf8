// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ClientConfig.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"

#include <string.h>

namespace {

class ClientConfigParser final : public ConfigParser {
	ClientConfig &config;

public:
	explicit ClientConfigParser(ClientConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

}

void
ClientConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "host") == 0) {
		config.host = line.ExpectValueAndEnd();
	} else if (strcmp(word, "timeout") == 0) {
		config.timeout = std::chrono::milliseconds{line.NextUnsigned()};
		line.ExpectEnd();
	} else if (strcmp(word, "verbose") == 0) {
		config.verbose = line.NextUnsigned();
		line.ExpectEnd();
	} else
		throw LineParser::Error{std::string{"Unknown option: "} + word};
}

void
LoadClientConfig(ClientConfig &config, const std::filesystem::path &path,
		 bool optional)
{
	ClientConfigParser parser{config};
	CommentConfigParser comment_parser{parser};

	if (optional)
		/* if the file does not exist, keep the defaults */
		ParseOptionalConfigFile(path, comment_parser);
	else
		ParseConfigFile(path, comment_parser);
}
