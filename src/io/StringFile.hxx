// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

class FileDescriptor;

/**
 * Read the whole contents of a (small) file into a string.
 *
 * Throws on error.
 */
std::string
LoadStringFile(const char *path);

/**
 * Read from an already-open descriptor (e.g. stdin) until
 * end-of-file.
 *
 * Throws on error.
 *
 * @param name the name of the stream for error messages
 */
std::string
LoadStringFile(FileDescriptor fd, const char *name);
