// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PrintStatus.hxx"
#include "radv/Status.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string_view>

using std::string_view_literals::operator""sv;

std::string
FormatStatusTable(const RadvControl::Status &status)
{
	static constexpr std::string_view name_header = "NAME"sv;

	std::size_t name_width = name_header.size();
	for (const auto &i : status.interfaces)
		name_width = std::max(name_width, i.name.size());

	std::string result;
	auto out = std::back_inserter(result);

	fmt::format_to(out, "{:<{}}  {}\n", name_header, name_width, "STATE"sv);

	for (const auto &i : status.interfaces)
		fmt::format_to(out, "{:<{}}  {}\n",
			       i.name, name_width, ToString(i.state));

	return result;
}
