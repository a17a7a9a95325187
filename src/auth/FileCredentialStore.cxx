// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileCredentialStore.hxx"
#include "Hash.hxx"
#include "io/LineParser.hxx"

#include <memory>
#include <system_error>

#include <errno.h>
#include <stdio.h>

void
FileCredentialStore::Add(std::string_view key_hash, std::string_view subject)
{
	if (!IsKeyHash(key_hash))
		throw std::runtime_error("Malformed key hash");

	if (subject.empty())
		throw std::runtime_error("Empty subject");

	credentials.insert_or_assign(std::string{key_hash}, std::string{subject});
}

void
FileCredentialStore::ParseLine(std::string_view _line)
{
	LineParser line(_line);
	if (line.IsEnd() || line.front() == '#')
		return;

	const auto key_hash = line.ExpectValue();
	if (line.IsEnd())
		throw LineParser::Error("Subject expected");

	if (auto subject = line.NextQuoted()) {
		line.ExpectEnd();
		Add(key_hash, *subject);
	} else
		/* unquoted subject: the rest of the line */
		Add(key_hash, line.Rest());
}

void
FileCredentialStore::Load(const boost::filesystem::path &path)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.native());

	std::unique_ptr<FILE, decltype(&fclose)> file_guard(file, fclose);

	char buffer[1024], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		try {
			ParseLine(line);
		} catch (...) {
			std::throw_with_nested(std::runtime_error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

std::optional<std::string>
FileCredentialStore::Lookup(std::string_view key_hash,
			    std::chrono::milliseconds)
{
	auto i = credentials.find(key_hash);
	if (i == credentials.end())
		return std::nullopt;

	return i->second;
}
