// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Status.hxx"

#include <fmt/format.h>

const char *
http_status_reason(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::UNDEFINED:
		break;

	case HttpStatus::CONTINUE:
		return "Continue";

	case HttpStatus::OK:
		return "OK";

	case HttpStatus::CREATED:
		return "Created";

	case HttpStatus::ACCEPTED:
		return "Accepted";

	case HttpStatus::NO_CONTENT:
		return "No Content";

	case HttpStatus::BAD_REQUEST:
		return "Bad Request";

	case HttpStatus::FORBIDDEN:
		return "Forbidden";

	case HttpStatus::NOT_FOUND:
		return "Not Found";

	case HttpStatus::METHOD_NOT_ALLOWED:
		return "Method Not Allowed";

	case HttpStatus::CONFLICT:
		return "Conflict";

	case HttpStatus::UNSUPPORTED_MEDIA_TYPE:
		return "Unsupported Media Type";

	case HttpStatus::UNPROCESSABLE_ENTITY:
		return "Unprocessable Entity";

	case HttpStatus::INTERNAL_SERVER_ERROR:
		return "Internal Server Error";

	case HttpStatus::NOT_IMPLEMENTED:
		return "Not Implemented";

	case HttpStatus::BAD_GATEWAY:
		return "Bad Gateway";

	case HttpStatus::SERVICE_UNAVAILABLE:
		return "Service Unavailable";

	case HttpStatus::GATEWAY_TIMEOUT:
		return "Gateway Timeout";
	}

	return nullptr;
}

std::string
FormatHttpStatus(HttpStatus status, std::string_view reason)
{
	const unsigned code = static_cast<unsigned>(status);

	if (reason.empty()) {
		const char *standard = http_status_reason(status);
		if (standard == nullptr)
			return fmt::format("{}", code);

		reason = standard;
	}

	return fmt::format("{} {}", code, reason);
}
