// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Error.hxx"
#include "lib/nlohmann_json/Lookup.hxx"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <stdexcept>

namespace RadvControl {

void
to_json(nlohmann::json &j, const InterfaceConfig &config)
{
	j = nlohmann::json{
		{"name", config.name},
		{"ra_interval_ms", config.ra_interval_ms},
	};
}

void
from_json(const nlohmann::json &j, InterfaceConfig &config)
{
	if (!j.is_object())
		throw std::invalid_argument{"Interface configuration is not an object"};

	config.name = Json::LookupString(j, "name");

	if (const auto *interval = Json::Lookup(j, "ra_interval_ms");
	    interval != nullptr && !interval->is_null()) {
		if (!interval->is_number_integer())
			throw std::invalid_argument{"\"ra_interval_ms\" is not an integer"};

		if (interval->is_number_unsigned() &&
		    interval->get<uint64_t>() > uint64_t(std::numeric_limits<int64_t>::max()))
			throw std::invalid_argument{"\"ra_interval_ms\" is out of range"};

		config.ra_interval_ms = interval->get<int64_t>();
	} else
		config.ra_interval_ms = 0;
}

void
to_json(nlohmann::json &j, const Config &config)
{
	j = nlohmann::json{{"interfaces", config.interfaces}};
}

void
from_json(const nlohmann::json &j, Config &config)
{
	if (!j.is_object())
		throw std::invalid_argument{"Configuration is not an object"};

	config.interfaces.clear();

	if (const auto *interfaces = Json::Lookup(j, "interfaces");
	    interfaces != nullptr && !interfaces->is_null())
		interfaces->get_to(config.interfaces);
}

std::string
EncodeConfig(const Config &config)
try {
	return nlohmann::json(config).dump();
} catch (const nlohmann::json::exception &) {
	/* most likely a string which is not valid UTF-8 */
	std::throw_with_nested(EncodeError{"Failed to encode configuration"});
}

Config
DecodeConfig(std::string_view json)
try {
	/* the whole body must be one JSON value; trailing data
	   after it is rejected */
	return nlohmann::json::parse(json).get<Config>();
} catch (const nlohmann::json::exception &) {
	std::throw_with_nested(DecodeError{"Failed to decode configuration"});
} catch (const std::invalid_argument &) {
	std::throw_with_nested(DecodeError{"Failed to decode configuration"});
}

} // namespace RadvControl
