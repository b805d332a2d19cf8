// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

inline constexpr const char *DEFAULT_CONFIG_PATH = "/etc/radvctl.conf";

enum class Command : uint_least8_t {
	RELOAD,
	STATUS,
};

struct CommandLine {
	std::filesystem::path config_path = DEFAULT_CONFIG_PATH;

	/**
	 * Was "--config" specified?  If not, a missing configuration
	 * file is not an error.
	 */
	bool explicit_config = false;

	std::optional<std::string> host;
	std::optional<std::chrono::milliseconds> timeout;

	/**
	 * The number of "-v" options.
	 */
	unsigned verbose = 0;

	/**
	 * Print the status as JSON instead of a table?
	 */
	bool json = false;

	bool help = false;

	Command command = Command::STATUS;

	/**
	 * The configuration file for #Command::RELOAD ("-" means
	 * stdin).
	 */
	std::string reload_path;
};

/**
 * The command line is malformed.
 */
class UsageError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Throws #UsageError on error.
 *
 * @param args the arguments without the program name
 */
CommandLine
ParseCommandLine(std::span<const char *const> args);

void
PrintUsage(const char *program);
