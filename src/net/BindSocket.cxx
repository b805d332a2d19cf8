// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BindSocket.hxx"
#include "UniqueSocketDescriptor.hxx"
#include "system/Error.hxx"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

UniqueSocketDescriptor
BindLoopback(int type, unsigned port)
{
	struct sockaddr_in sin{};
	sin.sin_family = AF_INET;
	sin.sin_port = htons(port);
	sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

	UniqueSocketDescriptor fd;
	if (!fd.Create(AF_INET, type, 0))
		throw MakeErrno("Failed to create socket");

	if (!fd.Bind((const struct sockaddr *)&sin, sizeof(sin)))
		throw MakeErrno("Failed to bind");

	return fd;
}
