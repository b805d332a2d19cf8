// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"

#include <fcntl.h>
#include <unistd.h>

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	fd = ::open(pathname, O_RDONLY|O_NOCTTY|O_CLOEXEC);
	return IsDefined();
}

bool
FileDescriptor::Close() noexcept
{
	if (!IsDefined())
		return false;

	int result = ::close(fd);
	fd = -1;
	return result == 0;
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
FileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}
