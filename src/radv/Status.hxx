// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RadvControl {

/**
 * The lifecycle state of an interface inside the daemon.  This is a
 * closed set: unknown values received from the daemon are a decode
 * error.
 */
enum class InterfaceState : uint_least8_t {
	/**
	 * Configured, but not yet sending advertisements.
	 */
	INIT,

	/**
	 * Sending periodic advertisements.
	 */
	RUNNING,
};

/**
 * Return the wire representation of the state ("Init", "Running").
 */
[[gnu::const]]
const char *
ToString(InterfaceState state) noexcept;

[[gnu::pure]]
std::optional<InterfaceState>
ParseInterfaceState(std::string_view s) noexcept;

struct InterfaceStatus {
	std::string name;
	InterfaceState state = InterfaceState::INIT;

	bool operator==(const InterfaceStatus &) const noexcept = default;
};

/**
 * A snapshot of the daemon's state, as returned by
 * Client::GetStatus().  The interfaces are in the order of the
 * most recently accepted #Config.
 */
struct Status {
	std::vector<InterfaceStatus> interfaces;

	bool operator==(const Status &) const noexcept = default;
};

void
to_json(nlohmann::json &j, const InterfaceStatus &status);

/**
 * Throws std::invalid_argument if the name is missing or the state is
 * not recognized.
 */
void
from_json(const nlohmann::json &j, InterfaceStatus &status);

void
to_json(nlohmann::json &j, const Status &status);

void
from_json(const nlohmann::json &j, Status &status);

/**
 * Parse a #Status from JSON.
 *
 * Throws #DecodeError on error; a partially decoded #Status is never
 * returned.
 */
Status
DecodeStatus(std::string_view json);

std::string
EncodeStatus(const Status &status);

} // namespace RadvControl
