// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace Json {

/**
 * Look up an object member.
 *
 * @return nullptr if #j is not an object or if there is no such
 * member
 */
[[gnu::pure]]
inline const nlohmann::json *
Lookup(const nlohmann::json &j, std::string_view key) noexcept
{
	if (!j.is_object())
		return nullptr;

	const auto i = j.find(key);
	return i != j.end() ? &*i : nullptr;
}

/**
 * Look up a member which must be a string if it exists.
 *
 * Throws nlohmann::json::type_error if the member exists but is not
 * a string.
 *
 * @return the string or an empty string_view if the member does not
 * exist or is null
 */
inline std::string_view
LookupString(const nlohmann::json &j, std::string_view key)
{
	const auto *value = Lookup(j, key);
	if (value == nullptr || value->is_null())
		return {};

	return value->get_ref<const std::string &>();
}

} // namespace Json
