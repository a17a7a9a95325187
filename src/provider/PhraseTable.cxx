// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PhraseTable.hxx"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

static std::string
MakeKey(std::string_view a, std::string_view b)
{
	std::string key{a};
	key.push_back('\t');
	key.append(b);
	return key;
}

static std::string
MakeKey(std::string_view a, std::string_view b, std::string_view c)
{
	auto key = MakeKey(a, b);
	key.push_back('\t');
	key.append(c);
	return key;
}

void
PhraseTable::Add(std::string_view source, std::string_view target,
		 std::string_view text, std::string_view translation)
{
	if (source.empty() || target.empty() || text.empty())
		throw std::runtime_error("Empty field");

	phrases.insert_or_assign(MakeKey(source, target, text),
				 std::string{translation});
	sources.insert_or_assign(MakeKey(target, text), std::string{source});
	languages.emplace(source);
	languages.emplace(target);
}

static std::string_view
NextField(std::string_view &line) noexcept
{
	const auto tab = line.find('\t');
	auto field = line.substr(0, tab);
	line = tab == line.npos ? std::string_view{} : line.substr(tab + 1);
	return field;
}

void
PhraseTable::ParseLine(std::string_view line)
{
	while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
		line.remove_suffix(1);

	if (line.empty() || line.front() == '#')
		return;

	if (std::count(line.begin(), line.end(), '\t') != 3)
		throw std::runtime_error("Four tab-separated fields expected");

	const auto source = NextField(line);
	const auto target = NextField(line);
	const auto text = NextField(line);
	Add(source, target, text, line);
}

void
PhraseTable::Load(const boost::filesystem::path &path)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.native());

	std::unique_ptr<FILE, decltype(&fclose)> file_guard(file, fclose);

	char *buffer = nullptr;
	std::size_t buffer_size = 0;
	std::unique_ptr<char *, void(*)(char **)> buffer_guard(&buffer, [](char **p){
		free(*p);
	});

	ssize_t nbytes;
	unsigned i = 1;
	while ((nbytes = getline(&buffer, &buffer_size, file)) >= 0) {
		try {
			ParseLine({buffer, std::size_t(nbytes)});
		} catch (...) {
			std::throw_with_nested(std::runtime_error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

const std::string *
PhraseTable::Find(std::string_view source, std::string_view target,
		  std::string_view text) const noexcept
{
	auto i = phrases.find(MakeKey(source, target, text));
	return i != phrases.end() ? &i->second : nullptr;
}

const std::string *
PhraseTable::FindSource(std::string_view target,
			std::string_view text) const noexcept
{
	auto i = sources.find(MakeKey(target, text));
	return i != sources.end() ? &i->second : nullptr;
}
