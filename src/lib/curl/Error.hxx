// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>

namespace Curl {

/**
 * An error reported by libcurl.
 */
class Error : public std::runtime_error {
	CURLcode code;

public:
	Error(CURLcode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	Error(CURLcode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

/**
 * Construct an #Error with a message composed of the given prefix and
 * curl_easy_strerror().
 */
[[nodiscard]]
Error
MakeError(CURLcode code, const char *prefix);

/**
 * Like MakeError(), but prefer the (more detailed) message from a
 * CURLOPT_ERRORBUFFER if it is not empty.
 */
[[nodiscard]]
Error
MakeError(CURLcode code, const char *prefix,
	  const char *error_buffer);

} // namespace Curl
