// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Status.hxx"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace RadvControl {

/**
 * The kinds of errors which may be thrown by #Client.  Each kind has
 * its own exception class derived from #ControlError.
 */
enum class ControlErrorKind : uint_least8_t {
	/**
	 * The #Config could not be serialized.  This is a bug in the
	 * caller; no request was sent.
	 */
	ENCODE,

	/**
	 * The HTTP request could not be constructed, e.g. because the
	 * daemon host is malformed.
	 */
	REQUEST,

	/**
	 * Network-level failure: connection refused, DNS failure,
	 * timeout or cancellation.  May be transient.
	 */
	TRANSPORT,

	/**
	 * The daemon responded with "500 Internal Server Error" and no
	 * structured payload.  The daemon state is unknown.
	 */
	SERVER,

	/**
	 * A response body which was expected to be JSON could not be
	 * decoded.  Client and daemon disagree about the schema.
	 */
	DECODE,

	/**
	 * The daemon rejected the request with a structured error
	 * message (see #DaemonError).
	 */
	DAEMON,
};

[[gnu::const]]
const char *
ToString(ControlErrorKind kind) noexcept;

/**
 * Base class for all errors thrown by #Client.  The underlying cause
 * (if any) is attached as a nested exception; use GetFullMessage() to
 * obtain the whole chain.
 */
class ControlError : public std::runtime_error {
	ControlErrorKind kind;

protected:
	ControlError(ControlErrorKind _kind, const char *_msg)
		:std::runtime_error(_msg), kind(_kind) {}

	ControlError(ControlErrorKind _kind, const std::string &_msg)
		:std::runtime_error(_msg), kind(_kind) {}

public:
	ControlErrorKind GetKind() const noexcept {
		return kind;
	}
};

class EncodeError : public ControlError {
public:
	template<typename M>
	explicit EncodeError(M &&_msg)
		:ControlError(ControlErrorKind::ENCODE, std::forward<M>(_msg)) {}
};

class RequestError : public ControlError {
public:
	template<typename M>
	explicit RequestError(M &&_msg)
		:ControlError(ControlErrorKind::REQUEST, std::forward<M>(_msg)) {}
};

class TransportError : public ControlError {
public:
	template<typename M>
	explicit TransportError(M &&_msg)
		:ControlError(ControlErrorKind::TRANSPORT, std::forward<M>(_msg)) {}
};

/**
 * The daemon responded with "500 Internal Server Error".  The
 * message is the status line, e.g. "500 Internal Server Error".
 */
class ServerError : public ControlError {
	HttpStatus status;

public:
	ServerError(HttpStatus _status, const std::string &_status_line)
		:ControlError(ControlErrorKind::SERVER, _status_line),
		 status(_status) {}

	HttpStatus GetStatus() const noexcept {
		return status;
	}
};

class DecodeError : public ControlError {
public:
	template<typename M>
	explicit DecodeError(M &&_msg)
		:ControlError(ControlErrorKind::DECODE, std::forward<M>(_msg)) {}
};

/**
 * A structured error response from the daemon, i.e.
 * `{"message": "..."}`.  The exception message is exactly the
 * daemon's message.
 */
class DaemonError : public ControlError {
	HttpStatus status;

public:
	DaemonError(HttpStatus _status, const std::string &_message)
		:ControlError(ControlErrorKind::DAEMON, _message),
		 status(_status) {}

	/**
	 * The HTTP status of the response which carried this error.
	 */
	HttpStatus GetStatus() const noexcept {
		return status;
	}

	std::string_view GetMessage() const noexcept {
		return what();
	}
};

/**
 * Decode the body of an error response.
 *
 * Throws #DecodeError if the body is not a valid error object.
 */
DaemonError
DecodeDaemonError(HttpStatus status, std::string_view body);

/**
 * Serialize an error object (the counterpart of
 * DecodeDaemonError()).
 */
std::string
EncodeDaemonError(std::string_view message);

} // namespace RadvControl
