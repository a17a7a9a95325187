// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <system_error>

using std::string_view_literals::operator""sv;

namespace fs = boost::filesystem;

/**
 * Protection against "@include" loops.
 */
static constexpr unsigned MAX_INCLUDE_DEPTH = 16;

void
BlockConfigParser::ParseLine(LineParser &line)
{
	if (!block) {
		ParseTopLine(line);
		return;
	}

	if (line.SkipSymbol('}')) {
		line.ExpectEnd();

		auto old = std::move(block);
		old->Finish();
	} else
		block->ParseLine(line);
}

void
BlockConfigParser::Finish()
{
	if (block)
		throw LineParser::Error("Block not closed at end of file");
}

const std::string &
ConfigFileReader::GetVariable(std::string_view name) const
{
	const auto i = variables.find(name);
	if (i == variables.end())
		throw LineParser::Error(fmt::format("No such variable: {}"sv,
						    name));

	return i->second;
}

static void
AppendEscaped(std::string &dest, std::string_view src)
{
	for (const char ch : src) {
		if (ch == '\\' || ch == '"')
			dest.push_back('\\');
		dest.push_back(ch);
	}
}

std::string
ConfigFileReader::Expand(std::string_view src) const
{
	std::string dest;
	dest.reserve(src.size());

	/* the quote character of the string we're in, or 0 */
	char quote = 0;

	while (!src.empty()) {
		const char ch = src.front();

		if (quote != 0 && ch == '\\' && src.size() >= 2) {
			/* copy escape sequences verbatim */
			dest.append(src.substr(0, 2));
			src.remove_prefix(2);
			continue;
		}

		if (quote != '\'' && src.starts_with("${"sv)) {
			const auto end = src.find('}');
			if (end == src.npos)
				throw LineParser::Error("Missing '}' after variable name");

			const auto name = src.substr(2, end - 2);
			if (name.empty())
				throw LineParser::Error("Variable name expected after '${'");

			const auto &value = GetVariable(name);
			if (quote == 0) {
				dest.push_back('"');
				AppendEscaped(dest, value);
				dest.push_back('"');
			} else
				AppendEscaped(dest, value);

			src.remove_prefix(end + 1);
			continue;
		}

		if (LineParser::IsQuote(ch)) {
			if (quote == 0)
				quote = ch;
			else if (quote == ch)
				quote = 0;
		}

		dest.push_back(ch);
		src.remove_prefix(1);
	}

	return dest;
}

void
ConfigFileReader::HandleLine(const fs::path &path, std::string_view raw)
{
	if (LineParser l{raw}; l.IsEnd() || l.front() == '#')
		return;

	std::string expanded;
	if (raw.find("${"sv) != raw.npos) {
		expanded = Expand(raw);
		raw = expanded;
	}

	LineParser line{raw};

	if (line.SkipKeyword("@set"sv)) {
		std::string name{line.ExpectWord()};
		line.ExpectSymbol('=');

		auto value = line.NextQuoted();
		if (!value)
			throw LineParser::Error("Quoted value expected after '='");

		line.ExpectEnd();

		variables.insert_or_assign(std::move(name), std::move(*value));
	} else if (line.SkipKeyword("@include"sv)) {
		auto p = line.NextQuoted();
		if (!p)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		Include(path, std::move(*p));
	} else
		parser.ParseLine(line);
}

inline void
ConfigFileReader::Include(const fs::path &base, std::string &&_p)
{
	if (include_depth >= MAX_INCLUDE_DEPTH)
		throw LineParser::Error("Too many nested includes");

	fs::path p{std::move(_p)};
	if (p.is_relative())
		p = base.parent_path() / p;

	++include_depth;

	try {
		Read(p);
	} catch (...) {
		--include_depth;
		throw;
	}

	--include_depth;
}

void
ConfigFileReader::Read(const fs::path &path)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.native());

	std::unique_ptr<FILE, decltype(&fclose)> file_guard(file, fclose);

	char buffer[4096];
	for (unsigned i = 1; fgets(buffer, sizeof(buffer), file) != nullptr; ++i) {
		try {
			HandleLine(path, buffer);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(fmt::format("{}:{}"sv,
									     path.native(), i)));
		}
	}
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	ConfigFileReader reader(parser);
	reader.Read(path);
	parser.Finish();
}
