// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

[[nodiscard]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, ErrnoCategory(), msg);
}

[[nodiscard]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}
