// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"

#include <fmt/core.h>

#include <string_view>

using std::string_view_literals::operator""sv;

/**
 * If #arg is "--name=value", return the value.
 */
static std::optional<std::string_view>
MatchOption(std::string_view arg, std::string_view name) noexcept
{
	if (!arg.starts_with(name))
		return std::nullopt;

	arg.remove_prefix(name.size());
	if (!arg.starts_with('='))
		return std::nullopt;

	return arg.substr(1);
}

static std::chrono::milliseconds
ParseTimeout(std::string_view s)
{
	if (s.empty())
		throw UsageError{"Timeout expected"};

	unsigned long value = 0;
	for (const char ch : s) {
		if (ch < '0' || ch > '9')
			throw UsageError{fmt::format("Malformed timeout: '{}'", s)};

		value = value * 10 + unsigned(ch - '0');
		if (value > 0xffffffffUL)
			throw UsageError{fmt::format("Timeout is too large: '{}'", s)};
	}

	return std::chrono::milliseconds{value};
}

static void
ParseOption(CommandLine &cmdline, std::string_view arg)
{
	if (arg == "-h"sv || arg == "--help"sv)
		cmdline.help = true;
	else if (arg == "-v"sv || arg == "--verbose"sv)
		++cmdline.verbose;
	else if (arg == "--json"sv)
		cmdline.json = true;
	else if (const auto config = MatchOption(arg, "--config"sv)) {
		if (config->empty())
			throw UsageError{"Configuration file path expected"};

		cmdline.config_path = *config;
		cmdline.explicit_config = true;
	} else if (const auto host = MatchOption(arg, "--host"sv)) {
		if (host->empty())
			throw UsageError{"Host expected"};

		cmdline.host = *host;
	} else if (const auto timeout = MatchOption(arg, "--timeout"sv))
		cmdline.timeout = ParseTimeout(*timeout);
	else
		throw UsageError{fmt::format("Unknown option: {}", arg)};
}

CommandLine
ParseCommandLine(std::span<const char *const> args)
{
	CommandLine cmdline;

	auto i = args.begin();
	for (; i != args.end(); ++i) {
		const std::string_view arg = *i;
		if (arg == "-"sv || !arg.starts_with('-'))
			break;

		ParseOption(cmdline, arg);
	}

	if (cmdline.help)
		return cmdline;

	if (i == args.end())
		throw UsageError{"Command expected"};

	const std::string_view command = *i++;

	if (command == "reload"sv) {
		if (i == args.end())
			throw UsageError{"Usage: reload FILE"};

		cmdline.command = Command::RELOAD;
		cmdline.reload_path = *i++;
	} else if (command == "status"sv) {
		cmdline.command = Command::STATUS;
	} else
		throw UsageError{fmt::format("Unknown command: {}", command)};

	if (i != args.end())
		throw UsageError{fmt::format("Too many arguments: {}", *i)};

	return cmdline;
}

void
PrintUsage(const char *program)
{
	fmt::print(stderr,
		   "Usage: {} [OPTIONS] COMMAND\n"
		   "\n"
		   "Commands:\n"
		   "  reload FILE   submit a new configuration (JSON, \"-\" = stdin)\n"
		   "  status        show the status of all interfaces\n"
		   "\n"
		   "Options:\n"
		   "  --config=PATH    load settings from PATH (default: {})\n"
		   "  --host=HOST:PORT daemon control address\n"
		   "  --timeout=MS     abort after MS milliseconds\n"
		   "  --json           print the status as JSON\n"
		   "  -v, --verbose    more log output (may be repeated)\n"
		   "  -h, --help       show this help\n",
		   program, DEFAULT_CONFIG_PATH);
}
