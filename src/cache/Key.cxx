// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "translation/Unit.hxx"

#include <fmt/format.h>

#include <functional>
#include <iterator>

static void
AppendField(std::string &dest, std::string_view value)
{
	fmt::format_to(std::back_inserter(dest), "{}:", value.size());
	dest.append(value);
}

static std::string
SerializeKey(const TranslationUnit &unit, const BatchOptions &options)
{
	std::string result;
	result.reserve(unit.text.size() + 64);

	AppendField(result, unit.text);
	AppendField(result, unit.source);
	AppendField(result, unit.target);
	AppendField(result, ToString(unit.format));
	AppendField(result, options.glossary_id);
	AppendField(result, options.formality);
	result.push_back(options.preserve_entities ? 'P' : '-');
	return result;
}

CacheKey::CacheKey(const TranslationUnit &unit, const BatchOptions &options)
	:value(SerializeKey(unit, options)),
	 hash(std::hash<std::string_view>{}(value))
{
}
