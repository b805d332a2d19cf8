// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm>
#include <cstring>
#include <span>
#include <stdexcept>

bool
BufferedReader::Fill()
{
	if (eof)
		return false;

	if (start > 0) {
		/* move the remaining data to the front */
		std::copy(buffer.begin() + start, buffer.begin() + end,
			  buffer.begin());
		end -= start;
		start = 0;
	}

	if (end >= MAX_LINE_LENGTH)
		throw std::runtime_error{"Line is too long"};

	if (buffer.size() < end + 2)
		buffer.resize(std::max(buffer.size() * 2, INITIAL_CAPACITY));

	/* reserve one byte for the null terminator */
	const std::span<char> w{buffer.data() + end, buffer.size() - end - 1};
	const std::size_t nbytes = reader.Read(std::as_writable_bytes(w));
	if (nbytes == 0) {
		eof = true;
		return false;
	}

	end += nbytes;
	return true;
}

char *
BufferedReader::ReadLine()
{
	std::size_t scan = start;

	while (true) {
		char *const p = buffer.data();
		char *newline = end > scan
			? (char *)std::memchr(p + scan, '\n', end - scan)
			: nullptr;
		if (newline != nullptr) {
			char *line = p + start;
			start = newline + 1 - p;

			if (newline > line && newline[-1] == '\r')
				--newline;
			*newline = 0;

			++line_number;
			return line;
		}

		scan = end - start;

		if (!Fill()) {
			if (start == end)
				return nullptr;

			/* unterminated last line; Fill() has left room
			   for the null terminator */
			char *line = buffer.data() + start;
			buffer[end] = 0;
			start = end;

			++line_number;
			return line;
		}
	}
}
