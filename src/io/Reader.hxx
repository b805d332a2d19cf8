// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

/**
 * An interface that can read bytes from a stream until the stream
 * ends.
 */
class Reader {
public:
	Reader() = default;
	Reader(const Reader &) = delete;

	/**
	 * Read data from the stream.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes read into the given buffer or 0
	 * on end-of-stream
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;
};
