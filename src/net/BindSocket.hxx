// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class UniqueSocketDescriptor;

/**
 * Create a socket bound to a port on the IPv4 loopback interface.
 * Port 0 selects an ephemeral port; see
 * SocketDescriptor::GetLocalPort().
 *
 * Throws on error.
 */
UniqueSocketDescriptor
BindLoopback(int type, unsigned port);
