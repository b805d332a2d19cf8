// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>

[[nodiscard]]
inline std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args)
{
	return std::runtime_error{fmt::vformat(format_str, args)};
}

template<typename S, typename... Args>
[[nodiscard]]
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args)
{
	return VFmtRuntimeError(format_str, fmt::make_format_args(args...));
}
