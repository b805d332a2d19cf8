// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketDescriptor.hxx"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	type |= SOCK_CLOEXEC;
	fd = ::socket(domain, type, protocol);
	return IsDefined();
}

bool
SocketDescriptor::Bind(const struct sockaddr *address,
		       std::size_t size) const noexcept
{
	return ::bind(fd, address, size) == 0;
}

bool
SocketDescriptor::Listen(int backlog) const noexcept
{
	return ::listen(fd, backlog) == 0;
}

SocketDescriptor
SocketDescriptor::Accept() const noexcept
{
	return SocketDescriptor(::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC));
}

unsigned
SocketDescriptor::GetLocalPort() const noexcept
{
	struct sockaddr_storage ss;
	socklen_t size = sizeof(ss);
	if (::getsockname(fd, (struct sockaddr *)&ss, &size) < 0)
		return 0;

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in *)&ss)->sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 *)&ss)->sin6_port);

	default:
		return 0;
	}
}

int
SocketDescriptor::WaitReadable(int timeout_ms) const noexcept
{
	struct pollfd pfd{fd, POLLIN, 0};
	return ::poll(&pfd, 1, timeout_ms);
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
	flags |= MSG_NOSIGNAL;
	return ::send(fd, src.data(), src.size(), flags);
}
