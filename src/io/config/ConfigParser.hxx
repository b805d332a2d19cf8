// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Parse the specified file line by line, and call
 * ConfigParser::Finish() at the end.  Errors are wrapped in an
 * exception which describes the file name and line number.
 *
 * Throws on error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);

/**
 * Like ParseConfigFile(), but a missing file is not an error.
 *
 * @return false if the file does not exist
 */
bool
ParseOptionalConfigFile(const std::filesystem::path &path,
			ConfigParser &parser);
