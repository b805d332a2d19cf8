// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

namespace RadvControl { struct Status; }

/**
 * Format the status as a table with one line per interface, e.g.:
 *
 *     NAME   STATE
 *     eth0   Running
 */
std::string
FormatStatusTable(const RadvControl::Status &status);
