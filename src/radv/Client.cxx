// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Setup.hxx"
#include "lib/curl/Slist.hxx"
#include "lib/curl/StringGlue.hxx"
#include "lib/curl/StringResponse.hxx"
#include "http/Status.hxx"
#include "net/HostParser.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

#include <exception>
#include <span>
#include <stdexcept>
#include <string_view>

using std::string_view_literals::operator""sv;

namespace RadvControl {

static const LLogger logger{"radv-control"};

/**
 * Is this libcurl error caused by the request itself (e.g. a
 * malformed URL) rather than by the network?
 */
[[gnu::const]]
static bool
IsRequestError(CURLcode code) noexcept
{
	switch (code) {
	case CURLE_UNSUPPORTED_PROTOCOL:
	case CURLE_FAILED_INIT:
	case CURLE_URL_MALFORMAT:
	case CURLE_NOT_BUILT_IN:
	case CURLE_BAD_FUNCTION_ARGUMENT:
		return true;

	default:
		return false;
	}
}

static int
CancelCallback(void *clientp,
	       curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept
{
	const auto &cancel = *(const std::atomic_bool *)clientp;
	return cancel.load(std::memory_order_relaxed) ? 1 : 0;
}

static CurlEasy
MakeEasy(const std::string &url, const RequestOptions &options)
{
	CurlEasy easy{url.c_str()};
	Curl::Setup(easy);

	if (options.timeout.count() > 0)
		easy.SetTimeout(options.timeout);

	if (options.cancel != nullptr)
		easy.SetXferInfoFunction(CancelCallback,
					 const_cast<std::atomic_bool *>(options.cancel));

	return easy;
}

/**
 * Handle a response other than "200 OK".  Always throws.
 */
[[noreturn]]
static void
ThrowResponseError(const StringCurlResponse &response)
{
	if (response.status == HttpStatus::INTERNAL_SERVER_ERROR)
		/* the daemon crashed; there is no structured
		   payload */
		throw ServerError(response.status,
				  FormatHttpStatus(response.status,
						   response.reason));

	throw DecodeDaemonError(response.status, response.body);
}

std::string
Client::MakeUrl(std::string_view path) const
{
	HostAndPort hp;

	try {
		hp = ParseHostAndPort(host.c_str());
	} catch (const std::invalid_argument &) {
		std::throw_with_nested(RequestError{fmt::format("Malformed daemon address '{}'",
								host)});
	}

	if (hp.ipv6 && host.front() != '[')
		return fmt::format("http://[{}]{}", host, path);

	return fmt::format("http://{}{}", host, path);
}

StringCurlResponse
Client::Perform(const char *method, const std::string &url,
		CurlEasy &&easy) const
{
	try {
		auto response = StringCurlRequest(std::move(easy));

		logger.Fmt(2, "{} {} -> {}", method, url,
			   FormatHttpStatus(response.status, response.reason));
		if (CheckLogLevel(3) && !response.body.empty()) {
			const auto ct = response.headers.find("content-type"sv);
			logger.Fmt(3, "response body ({}): {}",
				   ct != response.headers.end()
				   ? std::string_view{ct->second}
				   : "no content type"sv,
				   response.body);
		}

		return response;
	} catch (const Curl::Error &e) {
		logger(2, method, " ", url, " failed: ", std::current_exception());

		if (IsRequestError(e.GetCode()))
			std::throw_with_nested(RequestError{fmt::format("Failed to construct {} request for {}",
									method, url)});

		std::throw_with_nested(TransportError{fmt::format("{} {} failed",
								  method, url)});
	}
}

void
Client::Reload(const Config &config, const RequestOptions &options) const
{
	/* encode first: a configuration which cannot be serialized
	   is reported before anything else, and nothing is sent */
	const auto body = EncodeConfig(config);
	const auto url = MakeUrl("/reload");

	CurlSlist headers;
	CurlEasy easy{nullptr};

	try {
		headers.Append("Content-Type: application/json");

		/* disable "Expect: 100-continue" */
		headers.Append("Expect:");

		easy = MakeEasy(url, options);
		easy.SetRequestHeaders(headers.Get());
		easy.SetPost();
		easy.SetRequestBody(std::as_bytes(std::span{body}));
	} catch (const Curl::Error &) {
		std::throw_with_nested(RequestError{fmt::format("Failed to set up request for {}",
								url)});
	}

	logger.Fmt(3, "request body: {}", body);

	const auto response = Perform("POST", url, std::move(easy));
	if (response.status == HttpStatus::OK)
		/* the response body is ignored */
		return;

	ThrowResponseError(response);
}

Status
Client::GetStatus(const RequestOptions &options) const
{
	const auto url = MakeUrl("/status");

	CurlEasy easy{nullptr};

	try {
		easy = MakeEasy(url, options);
	} catch (const Curl::Error &) {
		std::throw_with_nested(RequestError{fmt::format("Failed to set up request for {}",
								url)});
	}

	const auto response = Perform("GET", url, std::move(easy));
	if (response.status == HttpStatus::OK)
		return DecodeStatus(response.body);

	ThrowResponseError(response);
}

} // namespace RadvControl
