// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringGlue.hxx"
#include "Easy.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <exception>
#include <string_view>

using std::string_view_literals::operator""sv;

namespace {

/**
 * Collects the response from the libcurl header and write callbacks.
 */
class StringCurlResponseBuilder {
	StringCurlResponse response{};

	/**
	 * An exception thrown by one of the callbacks, to be rethrown
	 * after curl_easy_perform() has returned.
	 */
	std::exception_ptr error;

public:
	void Install(CurlEasy &easy) {
		easy.SetHeaderFunction(_HeaderFunction, this);
		easy.SetWriteFunction(WriteFunction, this);
	}

	void CheckRethrowError() const {
		if (error)
			std::rethrow_exception(error);
	}

	StringCurlResponse Finish(CurlEasy &easy) && {
		response.status = easy.GetResponseCode();
		return std::move(response);
	}

private:
	void HeaderFunction(std::string_view line);

	static size_t _HeaderFunction(char *ptr, size_t size, size_t nmemb,
				      void *userdata) noexcept;

	static size_t WriteFunction(char *ptr, size_t size, size_t nmemb,
				    void *userdata) noexcept;
};

}

/**
 * Parse a status line like "HTTP/1.1 404 Not Found" and return the
 * reason phrase.
 */
static std::string_view
ExtractReasonPhrase(std::string_view line) noexcept
{
	/* skip the protocol version */
	auto space = line.find(' ');
	if (space == line.npos)
		return {};

	line = StripLeft(line.substr(space + 1));

	/* skip the status code */
	space = line.find(' ');
	if (space == line.npos)
		return {};

	return Strip(line.substr(space + 1));
}

static std::string
ToLowerASCII(std::string_view src) noexcept
{
	std::string result{src};
	std::transform(result.begin(), result.end(), result.begin(),
		       [](char ch){
			       return IsUpperAlphaASCII(ch)
				       ? char(ch - 'A' + 'a')
				       : ch;
		       });
	return result;
}

inline void
StringCurlResponseBuilder::HeaderFunction(std::string_view line)
{
	if (line.starts_with("HTTP/"sv)) {
		/* a new status line; this happens after "100
		   Continue" and after redirects: discard everything
		   we have collected so far */
		response.reason = ExtractReasonPhrase(line);
		response.headers.clear();
		return;
	}

	const auto colon = line.find(':');
	if (colon == line.npos || colon == 0)
		/* the empty line at the end, or a malformed header */
		return;

	response.headers.emplace(ToLowerASCII(Strip(line.substr(0, colon))),
				 Strip(line.substr(colon + 1)));
}

size_t
StringCurlResponseBuilder::_HeaderFunction(char *ptr, size_t size,
					   size_t nmemb,
					   void *userdata) noexcept
{
	auto &builder = *(StringCurlResponseBuilder *)userdata;
	const size_t length = size * nmemb;

	try {
		builder.HeaderFunction({ptr, length});
	} catch (...) {
		/* abort the transfer; the exception will be rethrown
		   by StringCurlRequest() */
		builder.error = std::current_exception();
		return 0;
	}

	return length;
}

size_t
StringCurlResponseBuilder::WriteFunction(char *ptr, size_t size, size_t nmemb,
					 void *userdata) noexcept
{
	auto &builder = *(StringCurlResponseBuilder *)userdata;
	const size_t length = size * nmemb;

	try {
		builder.response.body.append(ptr, length);
	} catch (...) {
		builder.error = std::current_exception();
		return 0;
	}

	return length;
}

StringCurlResponse
StringCurlRequest(CurlEasy easy)
{
	char error_buffer[CURL_ERROR_SIZE];
	error_buffer[0] = 0;
	easy.SetErrorBuffer(error_buffer);

	StringCurlResponseBuilder builder;
	builder.Install(easy);

	CURLcode code = curl_easy_perform(easy.Get());
	builder.CheckRethrowError();

	if (code != CURLE_OK)
		throw Curl::MakeError(code, "CURL error", error_buffer);

	return std::move(builder).Finish(easy);
}
