// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

/**
 * Result type for ExtractHost().
 */
struct ExtractHostResult {
	/**
	 * The host part of the address.
	 *
	 * If nothing was parsed, then this is a null string_view.
	 */
	std::string_view host;

	/**
	 * Pointer to the first character that was not parsed.  On
	 * success, this is usually a pointer to the zero terminator or to
	 * a colon followed by a port number.
	 *
	 * If nothing was parsed, then this is a pointer to the given
	 * source string.
	 */
	const char *end;

	constexpr bool HasFailed() const noexcept {
		return host.data() == nullptr;
	}
};

/**
 * Extract the host from a string in the form "IP:PORT" or
 * "[IPv6]:PORT".  Stops at the first invalid character (e.g. the
 * colon).
 *
 * @param src the input string
 */
[[gnu::pure]]
ExtractHostResult
ExtractHost(const char *src) noexcept;

/**
 * Result type for ParseHostAndPort().
 */
struct HostAndPort {
	std::string_view host;

	/**
	 * The port number or 0 if none was specified.
	 */
	uint_least16_t port = 0;

	/**
	 * Is #host an IPv6 address?  It needs to be enclosed in square
	 * brackets when used in a URL.
	 */
	bool ipv6 = false;
};

/**
 * Parse a complete "HOST", "HOST:PORT", "[IPv6]", "[IPv6]:PORT" or
 * "IPv6" string.  Unlike ExtractHost(), trailing garbage is an
 * error.
 *
 * Throws std::invalid_argument on error.
 */
HostAndPort
ParseHostAndPort(const char *src);
