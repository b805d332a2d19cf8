// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "lib/nlohmann_json/Lookup.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <exception>

namespace RadvControl {

const char *
ToString(ControlErrorKind kind) noexcept
{
	switch (kind) {
	case ControlErrorKind::ENCODE:
		return "encode";

	case ControlErrorKind::REQUEST:
		return "request";

	case ControlErrorKind::TRANSPORT:
		return "transport";

	case ControlErrorKind::SERVER:
		return "server";

	case ControlErrorKind::DECODE:
		return "decode";

	case ControlErrorKind::DAEMON:
		return "daemon";
	}

	return "unknown";
}

DaemonError
DecodeDaemonError(HttpStatus status, std::string_view body)
try {
	/* the whole body must be one JSON value; trailing data
	   after it is rejected */
	const auto j = nlohmann::json::parse(body);
	if (!j.is_object())
		throw std::invalid_argument{"Not a JSON object"};

	/* a missing "message" is tolerated (empty message), but it
	   must be a string if present */
	return {status, std::string{Json::LookupString(j, "message")}};
} catch (const nlohmann::json::exception &) {
	std::throw_with_nested(DecodeError{fmt::format("Failed to decode error response ({})",
						       FormatHttpStatus(status))});
} catch (const std::invalid_argument &) {
	std::throw_with_nested(DecodeError{fmt::format("Failed to decode error response ({})",
						       FormatHttpStatus(status))});
}

std::string
EncodeDaemonError(std::string_view message)
{
	return nlohmann::json{{"message", message}}.dump();
}

} // namespace RadvControl
