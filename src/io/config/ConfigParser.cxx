// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"

#include "io/BufferedReader.hxx"
#include "io/FdReader.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <exception>

#include <errno.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

static void
ParseConfigFile(const std::filesystem::path &path, BufferedReader &reader,
		ConfigParser &parser)
{
	while (char *line = reader.ReadLine()) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(),
									     reader.GetLineNumber())});
		}
	}

	parser.Finish();
}

static void
ParseConfigFile(const std::filesystem::path &path, FileDescriptor fd,
		ConfigParser &parser)
{
	FdReader fd_reader{fd};
	BufferedReader buffered_reader{fd_reader};
	ParseConfigFile(path, buffered_reader, parser);
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const auto fd = OpenReadOnly(path.c_str());
	ParseConfigFile(path, fd, parser);
}

bool
ParseOptionalConfigFile(const std::filesystem::path &path,
			ConfigParser &parser)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path.c_str())) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return false;

		default:
			throw FmtErrno(e, "Failed to open {}", path.native());
		}
	}

	ParseConfigFile(path, fd, parser);
	return true;
}
