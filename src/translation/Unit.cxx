// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Unit.hxx"

using std::string_view_literals::operator""sv;

const char *
ToString(TextFormat format) noexcept
{
	switch (format) {
	case TextFormat::TEXT:
		return "text";

	case TextFormat::HTML:
		return "html";
	}

	return "text";
}

bool
ParseTextFormat(std::string_view s, TextFormat &format) noexcept
{
	if (s == "text"sv) {
		format = TextFormat::TEXT;
		return true;
	} else if (s == "html"sv) {
		format = TextFormat::HTML;
		return true;
	} else
		return false;
}
