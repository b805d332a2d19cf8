// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FdReader.hxx"
#include "system/Error.hxx"

std::size_t
FdReader::Read(std::span<std::byte> dest)
{
	const auto nbytes = fd.Read(dest);
	if (nbytes < 0)
		throw MakeErrno("Failed to read");

	return nbytes;
}
