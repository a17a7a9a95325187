// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * A tokenizer for one line of a configuration or credential file.
 * Tokens are words (option names), values (quoted strings with
 * backslash escapes, or unquoted runs of #IsUnquotedChar()) and
 * single-character symbols.  Whitespace between tokens is skipped.
 */
class LineParser {
	std::string_view rest;

public:
	using Error = std::runtime_error;

	explicit LineParser(std::string_view line) noexcept
		:rest(line) {
		StripRight();
		Strip();
	}

	/**
	 * The unparsed remainder of the line.
	 */
	std::string_view Rest() const noexcept {
		return rest;
	}

	bool IsEnd() const noexcept {
		return rest.empty();
	}

	/**
	 * The next character, or 0 at the end of the line.
	 */
	char front() const noexcept {
		return rest.empty() ? 0 : rest.front();
	}

	void ExpectEnd() const;

	bool SkipSymbol(char symbol) noexcept;
	void ExpectSymbol(char symbol);

	/**
	 * Expect the opening brace of a block, which must be the last
	 * token on the line.
	 */
	void ExpectBlockOpen();

	/**
	 * If the next word is the given keyword, skip it and return
	 * true.  The keyword may contain a leading '@'.
	 */
	bool SkipKeyword(std::string_view keyword) noexcept;

	/**
	 * Throws if there is no word.
	 */
	std::string_view ExpectWord();

	/**
	 * Parse a quoted string.  Returns std::nullopt (without
	 * consuming anything) if the next token is not quoted.  Throws
	 * on a malformed string.
	 */
	std::optional<std::string> NextQuoted();

	/**
	 * Expect a non-empty quoted or unquoted value.
	 */
	std::string ExpectValue();

	std::string ExpectValueAndEnd() {
		auto value = ExpectValue();
		ExpectEnd();
		return value;
	}

	/**
	 * Expect a positive decimal integer and end-of-line.
	 */
	unsigned ExpectPositiveIntegerAndEnd();

	static constexpr bool IsWhitespace(char ch) noexcept {
		return ch > 0 && ch <= 0x20;
	}

	static constexpr bool IsWordChar(char ch) noexcept {
		return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
			(ch >= '0' && ch <= '9') || ch == '_';
	}

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/' || ch == '*';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}

private:
	void Strip() noexcept {
		while (!rest.empty() && IsWhitespace(rest.front()))
			rest.remove_prefix(1);
	}

	void StripRight() noexcept {
		while (!rest.empty() && IsWhitespace(rest.back()))
			rest.remove_suffix(1);
	}

	/**
	 * Split off the first #n characters, skipping whitespace after
	 * them.
	 */
	std::string_view Take(std::size_t n) noexcept {
		const auto result = rest.substr(0, n);
		rest.remove_prefix(n);
		Strip();
		return result;
	}

	/**
	 * Count the characters at the beginning of the remaining line
	 * which satisfy the given predicate.  Returns 0 if the run is
	 * not followed by whitespace or the end of the line.
	 */
	template<typename P>
	std::size_t TokenLength(P &&p) const noexcept {
		std::size_t n = 0;
		while (n < rest.size() && p(rest[n]))
			++n;

		if (n < rest.size() && !IsWhitespace(rest[n]))
			return 0;

		return n;
	}
};
