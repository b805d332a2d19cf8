// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Status.hxx"
#include "Error.hxx"
#include "lib/nlohmann_json/Lookup.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace RadvControl {

const char *
ToString(InterfaceState state) noexcept
{
	switch (state) {
	case InterfaceState::INIT:
		return "Init";

	case InterfaceState::RUNNING:
		return "Running";
	}

	return "Unknown";
}

std::optional<InterfaceState>
ParseInterfaceState(std::string_view s) noexcept
{
	if (s == "Init"sv)
		return InterfaceState::INIT;
	else if (s == "Running"sv)
		return InterfaceState::RUNNING;
	else
		return std::nullopt;
}

void
to_json(nlohmann::json &j, const InterfaceStatus &status)
{
	j = nlohmann::json{
		{"name", status.name},
		{"state", ToString(status.state)},
	};
}

void
from_json(const nlohmann::json &j, InterfaceStatus &status)
{
	if (!j.is_object())
		throw std::invalid_argument{"Interface status is not an object"};

	status.name = Json::LookupString(j, "name");
	if (status.name.empty())
		throw std::invalid_argument{"Interface name missing"};

	const auto *state = Json::Lookup(j, "state");
	if (state == nullptr || !state->is_string())
		throw std::invalid_argument{fmt::format("No state for interface '{}'",
							status.name)};

	const auto &s = state->get_ref<const std::string &>();
	const auto parsed = ParseInterfaceState(s);
	if (!parsed)
		throw std::invalid_argument{fmt::format("Unknown state '{}' for interface '{}'",
							s, status.name)};

	status.state = *parsed;
}

void
to_json(nlohmann::json &j, const Status &status)
{
	j = nlohmann::json{{"interfaces", status.interfaces}};
}

void
from_json(const nlohmann::json &j, Status &status)
{
	if (!j.is_object())
		throw std::invalid_argument{"Status is not an object"};

	status.interfaces.clear();

	if (const auto *interfaces = Json::Lookup(j, "interfaces");
	    interfaces != nullptr && !interfaces->is_null())
		interfaces->get_to(status.interfaces);
}

Status
DecodeStatus(std::string_view json)
try {
	/* the whole body must be one JSON value; trailing data
	   after it is rejected */
	return nlohmann::json::parse(json).get<Status>();
} catch (const nlohmann::json::exception &) {
	std::throw_with_nested(DecodeError{"Failed to decode status response"});
} catch (const std::invalid_argument &) {
	std::throw_with_nested(DecodeError{"Failed to decode status response"});
}

std::string
EncodeStatus(const Status &status)
{
	return nlohmann::json(status).dump();
}

} // namespace RadvControl
