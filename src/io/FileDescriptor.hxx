// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor.  This class does not
 * own the descriptor; see #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * @return false on error (errno is set)
	 */
	bool OpenReadOnly(const char *pathname) noexcept;

	/**
	 * Close the descriptor and mark this instance "undefined".
	 */
	bool Close() noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept;

	ssize_t Write(std::span<const std::byte> src) const noexcept;
};
