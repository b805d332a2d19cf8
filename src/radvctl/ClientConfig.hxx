// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

/**
 * Settings of the "radvctl" program, loaded from the configuration
 * file and overridden by command-line options.
 */
struct ClientConfig {
	/**
	 * The daemon's control address ("HOST:PORT").
	 */
	std::string host = "localhost:8888";

	/**
	 * Zero means no timeout.
	 */
	std::chrono::milliseconds timeout{};

	unsigned verbose = 1;
};

/**
 * Load the configuration file.  Throws on error.
 *
 * @param optional if true, then a missing file is not an error
 */
void
LoadClientConfig(ClientConfig &config, const std::filesystem::path &path,
		 bool optional);
