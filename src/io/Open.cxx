// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

UniqueFileDescriptor
OpenReadOnly(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	return fd;
}
