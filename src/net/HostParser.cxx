// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HostParser.hxx"
#include "util/CharUtil.hxx"

#include <stdexcept>

#include <string.h>

static constexpr bool
IsValidHostnameChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' || ch == '_';
}

static constexpr bool
IsValidIPv6Char(char ch) noexcept
{
	return IsHexDigit(ch) || ch == ':' || ch == '.';
}

static const char *
FindIPv6End(const char *p) noexcept
{
	while (IsValidIPv6Char(*p))
		++p;
	return p;
}

ExtractHostResult
ExtractHost(const char *src) noexcept
{
	ExtractHostResult result{{}, src};

	if (IsValidHostnameChar(*src)) {
		const char *colon = nullptr;
		const char *hostname = src++;

		while (IsValidHostnameChar(*src) || *src == ':') {
			if (*src == ':') {
				if (colon != nullptr) {
					/* found a second colon: assume it's an IPv6
					   address */
					result.end = FindIPv6End(src + 1);
					result.host = {hostname, result.end};
					return result;
				} else
					/* remember the position of the first colon */
					colon = src;
			}

			++src;
		}

		if (colon != nullptr)
			/* hostname ends at colon */
			src = colon;

		result.end = src;
		result.host = {hostname, result.end};
	} else if (src[0] == ':' && src[1] == ':') {
		/* IPv6 address beginning with "::" */
		result.end = FindIPv6End(src + 2);
		result.host = {src, result.end};
	} else if (src[0] == '[') {
		/* "[hostname]:port" (IPv6?) */

		const char *hostname = ++src;
		const char *end = strchr(hostname, ']');
		if (end == nullptr || end == hostname)
			/* failed, return nullptr */
			return result;

		result.host = {hostname, end};
		result.end = end + 1;
	}

	return result;
}

static uint_least16_t
ParsePort(const char *p)
{
	if (*p == 0)
		throw std::invalid_argument{"Port number expected"};

	unsigned value = 0;
	for (; *p != 0; ++p) {
		if (!IsDigitASCII(*p))
			throw std::invalid_argument{"Malformed port number"};

		value = value * 10 + unsigned(*p - '0');
		if (value > 0xffff)
			throw std::invalid_argument{"Port number out of range"};
	}

	if (value == 0)
		throw std::invalid_argument{"Port number out of range"};

	return value;
}

HostAndPort
ParseHostAndPort(const char *src)
{
	const auto eh = ExtractHost(src);
	if (eh.HasFailed())
		throw std::invalid_argument{"Malformed host"};

	HostAndPort result;
	result.host = eh.host;
	result.ipv6 = result.host.find(':') != result.host.npos;

	if (*eh.end == ':')
		result.port = ParsePort(eh.end + 1);
	else if (*eh.end != 0)
		throw std::invalid_argument{"Malformed host"};

	return result;
}
