// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/format.h>

#include <charconv>

using std::string_view_literals::operator""sv;

void
LineParser::ExpectEnd() const
{
	if (!IsEnd())
		throw Error(fmt::format("Unexpected tokens at end of line: {}"sv,
					rest));
}

bool
LineParser::SkipSymbol(char symbol) noexcept
{
	if (front() != symbol)
		return false;

	Take(1);
	return true;
}

void
LineParser::ExpectSymbol(char symbol)
{
	if (!SkipSymbol(symbol))
		throw Error(fmt::format("'{}' expected"sv, symbol));
}

void
LineParser::ExpectBlockOpen()
{
	ExpectSymbol('{');

	if (!IsEnd())
		throw Error(fmt::format("Unexpected tokens after '{{': {}"sv,
					rest));
}

bool
LineParser::SkipKeyword(std::string_view keyword) noexcept
{
	if (!rest.starts_with(keyword))
		return false;

	if (rest.size() > keyword.size() && !IsWhitespace(rest[keyword.size()]))
		/* only a prefix of a longer word */
		return false;

	Take(keyword.size());
	return true;
}

std::string_view
LineParser::ExpectWord()
{
	const std::size_t n = TokenLength(IsWordChar);
	if (n == 0)
		throw Error("Word expected");

	return Take(n);
}

std::optional<std::string>
LineParser::NextQuoted()
{
	const char quote = front();
	if (!IsQuote(quote))
		return std::nullopt;

	std::string value;

	for (std::size_t i = 1; i < rest.size(); ++i) {
		char ch = rest[i];

		if (ch == quote) {
			Take(i + 1);
			return value;
		}

		if (ch == '\\') {
			if (++i == rest.size())
				break;

			switch (ch = rest[i]) {
			case 'n':
				ch = '\n';
				break;

			case 'r':
				ch = '\r';
				break;

			case 't':
				ch = '\t';
				break;

			case '\\':
			case '"':
			case '\'':
				break;

			default:
				throw Error(fmt::format("Invalid escape sequence '\\{}'"sv,
							ch));
			}
		}

		value.push_back(ch);
	}

	throw Error(fmt::format("Missing closing {} quote"sv, quote));
}

std::string
LineParser::ExpectValue()
{
	std::string value;

	if (auto quoted = NextQuoted())
		value = std::move(*quoted);
	else if (const std::size_t n = TokenLength(IsUnquotedChar); n > 0)
		value = Take(n);

	if (value.empty())
		throw Error("Value expected");

	return value;
}

unsigned
LineParser::ExpectPositiveIntegerAndEnd()
{
	const std::size_t n = TokenLength([](char ch){
		return ch >= '0' && ch <= '9';
	});

	unsigned value = 0;
	const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + n,
					       value);
	if (n == 0 || ec != std::errc{} || value == 0)
		throw Error("Positive integer expected");

	Take(n);
	ExpectEnd();
	return value;
}
