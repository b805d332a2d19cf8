// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/format.h>

namespace Curl {

Error
MakeError(CURLcode code, const char *prefix)
{
	return {code, fmt::format("{}: {}", prefix, curl_easy_strerror(code))};
}

Error
MakeError(CURLcode code, const char *prefix,
	  const char *error_buffer)
{
	if (error_buffer == nullptr || *error_buffer == 0)
		return MakeError(code, prefix);

	return {code, fmt::format("{}: {}", prefix, error_buffer)};
}

} // namespace Curl
