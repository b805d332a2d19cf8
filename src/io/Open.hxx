// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class UniqueFileDescriptor;

/**
 * Open a file for reading.
 *
 * Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path);
