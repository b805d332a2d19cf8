// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"
#include "http/Status.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <new>
#include <span>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::bad_alloc on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::bad_alloc{};
	}

	/**
	 * Allocate a new CURL* and set the URL.
	 *
	 * Throws on error.
	 */
	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	explicit CurlEasy(std::nullptr_t) noexcept {}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw Curl::MakeError(code, "Failed to set option");
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetErrorBuffer(char *buffer) {
		SetOption(CURLOPT_ERRORBUFFER, buffer);
	}

	void SetNoProgress(bool value=true) {
		SetOption(CURLOPT_NOPROGRESS, (long)value);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	/**
	 * Limit the duration of the whole transfer.  Zero means no
	 * limit.
	 */
	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetHeaderFunction(size_t (*function)(char *buffer, size_t size,
						  size_t nitems,
						  void *userdata),
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(size_t (*function)(char *ptr, size_t size,
						 size_t nmemb,
						 void *userdata),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	/**
	 * Install a progress callback.  If it returns non-zero, the
	 * transfer is aborted with #CURLE_ABORTED_BY_CALLBACK.
	 */
	void SetXferInfoFunction(int (*function)(void *clientp,
						 curl_off_t dltotal,
						 curl_off_t dlnow,
						 curl_off_t ultotal,
						 curl_off_t ulnow),
				 void *clientp) {
		SetOption(CURLOPT_XFERINFOFUNCTION, function);
		SetOption(CURLOPT_XFERINFODATA, clientp);
		SetNoProgress(false);
	}

	void SetPost(bool value=true) {
		SetOption(CURLOPT_POST, (long)value);
	}

	/**
	 * Set the POST request body.  The buffer is not copied; it
	 * must remain valid until the transfer has finished.
	 */
	void SetRequestBody(std::span<const std::byte> body) {
		SetOption(CURLOPT_POSTFIELDS, (const void *)body.data());
		SetOption(CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
	}

	[[gnu::pure]]
	HttpStatus GetResponseCode() const noexcept {
		long value;
		if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE,
				      &value) != CURLE_OK)
			return HttpStatus::UNDEFINED;

		return static_cast<HttpStatus>(value);
	}
};
