// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * A HTTP response status code.  Only the codes which are part of the
 * daemon control protocol have names; all other values may still be
 * stored in this type by casting.
 */
enum class HttpStatus : uint_least16_t {
	/**
	 * Not an actual HTTP status code, but a "magic" value which
	 * means this status has no value.  This can be used as an
	 * initializer.
	 */
	UNDEFINED = 0,

	CONTINUE = 100,

	OK = 200,
	CREATED = 201,
	ACCEPTED = 202,
	NO_CONTENT = 204,

	BAD_REQUEST = 400,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	CONFLICT = 409,
	UNSUPPORTED_MEDIA_TYPE = 415,

	/**
	 * @see RFC 4918 (WebDAV)
	 */
	UNPROCESSABLE_ENTITY = 422,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
};

/**
 * Return the standard reason phrase for the given status (without
 * the numeric code), or nullptr if the code is not known.
 */
[[gnu::const]]
const char *
http_status_reason(HttpStatus status) noexcept;

/**
 * Format a status line in the form "500 Internal Server Error" (like
 * Go's "http.Response.Status").  If #reason is empty (e.g. because the
 * response was received over HTTP/2), the standard reason phrase is
 * used.
 */
[[gnu::pure]]
std::string
FormatHttpStatus(HttpStatus status, std::string_view reason={});
