// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>

/**
 * A table of known translations for the on-device engine.  The file
 * format is tab-separated: source language, target language, text,
 * translation.  Empty lines and lines starting with '#' are
 * ignored.
 */
class PhraseTable {
	/**
	 * Key: "source<TAB>target<TAB>text".
	 */
	std::map<std::string, std::string, std::less<>> phrases;

	/**
	 * Key: "target<TAB>text", value: source language.  Used if the
	 * source language is not known.
	 */
	std::map<std::string, std::string, std::less<>> sources;

	std::set<std::string, std::less<>> languages;

public:
	/**
	 * Throws on error.
	 */
	void Load(const boost::filesystem::path &path);

	/**
	 * Parse one line of the file format.  Throws on syntax error.
	 */
	void ParseLine(std::string_view line);

	void Add(std::string_view source, std::string_view target,
		 std::string_view text, std::string_view translation);

	bool empty() const noexcept {
		return phrases.empty();
	}

	/**
	 * @return the translation or nullptr if the phrase is not known
	 */
	[[gnu::pure]]
	const std::string *Find(std::string_view source, std::string_view target,
				std::string_view text) const noexcept;

	/**
	 * Find the source language of a phrase which is known to
	 * translate to the given target.
	 *
	 * @return the source language or nullptr
	 */
	[[gnu::pure]]
	const std::string *FindSource(std::string_view target,
				      std::string_view text) const noexcept;

	/**
	 * All languages which appear in the table.
	 */
	const auto &GetLanguages() const noexcept {
		return languages;
	}
};
