// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <span>

#include <sys/types.h>

struct sockaddr;

/**
 * An OO wrapper for a socket descriptor.  This class does not own
 * the descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor : protected FileDescriptor {
protected:
	explicit constexpr SocketDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::Close;

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(FileDescriptor::Undefined());
	}

	/**
	 * Create a socket with O_CLOEXEC.
	 *
	 * @return false on error (errno is set)
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	bool Bind(const struct sockaddr *address, std::size_t size) const noexcept;

	bool Listen(int backlog) const noexcept;

	/**
	 * @return an "undefined" instance on error (errno is set)
	 */
	SocketDescriptor Accept() const noexcept;

	/**
	 * @return the port number this socket is bound to or 0 on
	 * error
	 */
	[[gnu::pure]]
	unsigned GetLocalPort() const noexcept;

	/**
	 * Wait until the socket becomes readable.
	 *
	 * @return a positive value if readable, 0 on timeout, -1 on
	 * error (errno is set)
	 */
	int WaitReadable(int timeout_ms) const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;

	/**
	 * Send data without raising SIGPIPE.
	 */
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;
};
