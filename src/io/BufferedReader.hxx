// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <vector>

class Reader;

/**
 * Reads lines from a #Reader.
 */
class BufferedReader {
	static constexpr std::size_t INITIAL_CAPACITY = 4096;
	static constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;

	Reader &reader;

	std::vector<char> buffer;

	/**
	 * The range of data which has been read but not yet consumed.
	 */
	std::size_t start = 0, end = 0;

	bool eof = false;

	unsigned line_number = 0;

public:
	explicit BufferedReader(Reader &_reader) noexcept
		:reader(_reader) {}

	BufferedReader(const BufferedReader &) = delete;
	BufferedReader &operator=(const BufferedReader &) = delete;

	/**
	 * Read one line.  The trailing newline (and a carriage return
	 * before it) is stripped.  The last line of the stream does not
	 * need to be terminated.
	 *
	 * Throws on I/O error or if the line is too long.
	 *
	 * @return a null-terminated line which is valid until the next
	 * call, or nullptr at end of stream
	 */
	char *ReadLine();

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * Read more data into the buffer.
	 *
	 * @return false at end of stream
	 */
	bool Fill();
};
