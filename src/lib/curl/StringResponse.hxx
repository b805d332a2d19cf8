// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Headers.hxx"

#include <cstdint>
#include <string>

enum class HttpStatus : uint_least16_t;

struct StringCurlResponse {
	HttpStatus status;

	/**
	 * The reason phrase from the status line, e.g. "Not Found".
	 * This is empty if the server did not send one (e.g. HTTP/2).
	 */
	std::string reason;

	Curl::Headers headers;
	std::string body;
};
