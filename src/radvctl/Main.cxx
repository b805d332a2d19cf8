// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "ClientConfig.hxx"
#include "PrintStatus.hxx"
#include "radv/Client.hxx"
#include "radv/Config.hxx"
#include "radv/Status.hxx"
#include "io/Logger.hxx"
#include "io/StringFile.hxx"
#include "io/FileDescriptor.hxx"
#include "util/PrintException.hxx"

#include <curl/curl.h>
#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include <sysexits.h> // for EX_*
#include <unistd.h> // for STDIN_FILENO

using std::string_view_literals::operator""sv;

/**
 * Calls curl_global_init() and curl_global_cleanup().
 */
class ScopeCurlInit {
public:
	ScopeCurlInit() {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw std::runtime_error{curl_easy_strerror(code)};
	}

	~ScopeCurlInit() noexcept {
		curl_global_cleanup();
	}

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};

static ClientConfig
LoadConfig(const CommandLine &cmdline)
{
	ClientConfig config;
	LoadClientConfig(config, cmdline.config_path, !cmdline.explicit_config);

	if (cmdline.host)
		config.host = *cmdline.host;

	if (cmdline.timeout)
		config.timeout = *cmdline.timeout;

	config.verbose += cmdline.verbose;

	return config;
}

static std::string
LoadReloadFile(const std::string &path)
{
	if (path == "-"sv)
		return LoadStringFile(FileDescriptor{STDIN_FILENO}, "stdin");

	return LoadStringFile(path.c_str());
}

static void
Reload(const RadvControl::Client &client,
       const RadvControl::RequestOptions &options,
       const std::string &path)
{
	const auto config = RadvControl::DecodeConfig(LoadReloadFile(path));
	client.Reload(config, options);
}

static void
ShowStatus(const RadvControl::Client &client,
	   const RadvControl::RequestOptions &options,
	   bool json)
{
	const auto status = client.GetStatus(options);

	if (json)
		fmt::print("{}\n", RadvControl::EncodeStatus(status));
	else
		fmt::print("{}", FormatStatusTable(status));
}

int
main(int argc, char **argv)
try {
	const char *const*args = argv + 1;
	CommandLine cmdline;

	try {
		cmdline = ParseCommandLine({args, std::size_t(argc - 1)});
	} catch (const UsageError &e) {
		fmt::print(stderr, "{}\n\n", e.what());
		PrintUsage(argv[0]);
		return EX_USAGE;
	}

	if (cmdline.help) {
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;
	}

	const auto config = LoadConfig(cmdline);
	SetLogLevel(config.verbose);

	const ScopeCurlInit curl_init;

	const RadvControl::Client client{config.host};
	const RadvControl::RequestOptions options{
		.timeout = config.timeout,
	};

	switch (cmdline.command) {
	case Command::RELOAD:
		Reload(client, options, cmdline.reload_path);
		break;

	case Command::STATUS:
		ShowStatus(client, options, cmdline.json);
		break;
	}

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
