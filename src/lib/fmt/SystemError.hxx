// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <fmt/core.h>

#include <utility>

[[nodiscard]]
inline std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args)
{
	return std::system_error(code, ErrnoCategory(),
				 fmt::vformat(format_str, args));
}

template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args)
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

/**
 * Like FmtErrno(int, ...), but use the current errno value.
 */
template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(const S &format_str, Args&&... args)
{
	const int code = errno;
	return FmtErrno(code, format_str, std::forward<Args>(args)...);
}
