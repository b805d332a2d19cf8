// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

struct StringCurlResponse;
class CurlEasy;

namespace RadvControl {

struct Config;

/**
 * Per-call options for #Client.
 */
struct RequestOptions {
	/**
	 * Abort the whole exchange (connect, send, receive) after this
	 * duration with a #TransportError.  Zero means no limit.
	 */
	std::chrono::milliseconds timeout{};

	/**
	 * If set, this flag is polled during the transfer; as soon as
	 * it becomes true, the transfer is aborted with a
	 * #TransportError.  The pointed-to object must remain valid
	 * until the call returns.
	 */
	const std::atomic_bool *cancel = nullptr;
};

/**
 * A client for the control API of the router advertisement daemon.
 *
 * The client holds no state other than the daemon address; every
 * call is an independent HTTP exchange (exactly one request, no
 * retries), and one instance may be used by multiple threads
 * concurrently.
 *
 * All methods throw an exception derived from #ControlError on
 * failure.
 */
class Client {
	/**
	 * The daemon address in the form "HOST:PORT".
	 */
	const std::string host;

public:
	explicit Client(std::string _host) noexcept
		:host(std::move(_host)) {}

	/**
	 * Submit a new configuration ("POST /reload").  Returns
	 * normally if the daemon has accepted it.
	 *
	 * Throws #EncodeError, #RequestError, #TransportError,
	 * #ServerError, #DecodeError or #DaemonError.
	 */
	void Reload(const Config &config,
		    const RequestOptions &options={}) const;

	/**
	 * Query the current daemon status ("GET /status").
	 *
	 * Throws #RequestError, #TransportError, #ServerError,
	 * #DecodeError or #DaemonError.
	 */
	Status GetStatus(const RequestOptions &options={}) const;

private:
	/**
	 * Throws #RequestError if the host is malformed.
	 */
	std::string MakeUrl(std::string_view path) const;

	StringCurlResponse Perform(const char *method, const std::string &url,
				   CurlEasy &&easy) const;
};

} // namespace RadvControl
