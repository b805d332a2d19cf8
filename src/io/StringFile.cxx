// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringFile.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <span>

static constexpr std::size_t MAX_SIZE = 1024 * 1024;

std::string
LoadStringFile(FileDescriptor fd, const char *name)
{
	std::string result;

	char buffer[4096];
	while (true) {
		const auto nbytes = fd.Read(std::as_writable_bytes(std::span{buffer}));
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", name);

		if (nbytes == 0)
			break;

		if (result.size() + nbytes > MAX_SIZE)
			throw FmtRuntimeError("File is too large: {}", name);

		result.append(buffer, nbytes);
	}

	return result;
}

std::string
LoadStringFile(const char *path)
{
	const auto fd = OpenReadOnly(path);
	return LoadStringFile(fd, path);
}
