// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace RadvControl {

/**
 * Daemon settings for one network interface.
 */
struct InterfaceConfig {
	/**
	 * The interface name, e.g. "eth0".  The daemon requires it to
	 * be non-empty and unique within a #Config.
	 */
	std::string name;

	/**
	 * The interval between two unsolicited router advertisements
	 * in milliseconds.  The daemon rejects non-positive values.
	 */
	int64_t ra_interval_ms = 0;

	bool operator==(const InterfaceConfig &) const noexcept = default;
};

/**
 * A complete daemon configuration, as sent by Client::Reload().
 */
struct Config {
	std::vector<InterfaceConfig> interfaces;

	bool operator==(const Config &) const noexcept = default;
};

void
to_json(nlohmann::json &j, const InterfaceConfig &config);

void
from_json(const nlohmann::json &j, InterfaceConfig &config);

void
to_json(nlohmann::json &j, const Config &config);

void
from_json(const nlohmann::json &j, Config &config);

/**
 * Serialize a #Config to JSON.
 *
 * Throws #EncodeError on error.
 */
std::string
EncodeConfig(const Config &config);

/**
 * Parse a #Config from JSON.  Unknown members are ignored; missing
 * members get their default values.  The values are not validated;
 * that is the daemon's job.
 *
 * Throws #DecodeError on error.
 */
Config
DecodeConfig(std::string_view json);

} // namespace RadvControl
