// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Json.hxx"
#include "coordinator/Error.hxx"
#include "provider/Error.hxx"
#include "translation/Error.hxx"
#include "translation/Language.hxx"
#include "translation/Result.hxx"
#include "translation/Unit.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

static nlohmann::json
ParseObject(std::string_view body)
{
	auto root = nlohmann::json::parse(body, nullptr, false);
	if (root.is_discarded())
		throw ValidationError("body"sv, "Malformed JSON"sv);

	if (!root.is_object())
		throw ValidationError("body"sv, "JSON object expected"sv);

	return root;
}

/**
 * Look up an optional string member.
 *
 * @return nullptr if the member does not exist or is null
 */
static const std::string *
GetOptionalString(const nlohmann::json &object, std::string_view name)
{
	const auto i = object.find(name);
	if (i == object.end() || i->is_null())
		return nullptr;

	if (!i->is_string())
		throw ValidationError(name, "String expected"sv);

	return i->get_ptr<const std::string *>();
}

static const std::string &
GetRequiredString(const nlohmann::json &object, std::string_view name)
{
	const auto *value = GetOptionalString(object, name);
	if (value == nullptr)
		throw ValidationError(name, "Missing"sv);

	if (value->empty())
		throw ValidationError(name, "Must not be empty"sv);

	return *value;
}

static void
ParseOptions(const nlohmann::json &options, BatchOptions &dest)
{
	if (options.is_null())
		return;

	if (!options.is_object())
		throw ValidationError("options"sv, "JSON object expected"sv);

	if (const auto i = options.find("formality"sv);
	    i != options.end() && !i->is_null()) {
		if (!i->is_string())
			throw ValidationError("options.formality"sv,
					      "String expected"sv);

		dest.formality = i->get<std::string>();
	}

	if (const auto i = options.find("preserve_entities"sv);
	    i != options.end() && !i->is_null()) {
		if (!i->is_boolean())
			throw ValidationError("options.preserve_entities"sv,
					      "Boolean expected"sv);

		dest.preserve_entities = i->get<bool>();
	}
}

BatchRequest
ParseTranslateRequest(std::string_view body, const RequestLimits &limits)
{
	const auto root = ParseObject(body);

	const auto texts = root.find("texts"sv);
	if (texts == root.end() || texts->is_null())
		throw ValidationError("texts"sv, "Missing"sv);

	if (!texts->is_array())
		throw ValidationError("texts"sv, "Array expected"sv);

	if (texts->empty())
		throw ValidationError("texts"sv, "Must not be empty"sv);

	if (texts->size() > limits.max_batch_size)
		throw ValidationError("texts"sv,
				      fmt::format("No more than {} texts allowed"sv,
						  limits.max_batch_size));

	const auto &target = GetRequiredString(root, "target"sv);

	std::string source{AUTO_LANGUAGE};
	if (const auto *s = GetOptionalString(root, "source"sv)) {
		if (s->empty())
			throw ValidationError("source"sv, "Must not be empty"sv);
		source = *s;
	}

	TextFormat format = TextFormat::TEXT;
	if (const auto *f = GetOptionalString(root, "format"sv);
	    f != nullptr && !ParseTextFormat(*f, format))
		throw ValidationError("format"sv, "Must be \"text\" or \"html\""sv);

	BatchRequest request;

	if (const auto *g = GetOptionalString(root, "glossary_id"sv))
		request.options.glossary_id = *g;

	if (const auto o = root.find("options"sv); o != root.end())
		ParseOptions(*o, request.options);

	request.units.reserve(texts->size());

	std::size_t index = 0;
	for (const auto &i : *texts) {
		if (!i.is_string())
			throw ValidationError(fmt::format("texts[{}]"sv, index),
					      "String expected"sv);

		const auto &text = i.get_ref<const std::string &>();
		if (text.size() > limits.max_text_length)
			throw ValidationError(fmt::format("texts[{}]"sv, index),
					      fmt::format("Longer than {} bytes"sv,
							  limits.max_text_length));

		request.units.push_back({
			.text = text,
			.source = source,
			.target = target,
			.format = format,
		});

		++index;
	}

	return request;
}

std::string
ParseDetectRequest(std::string_view body, const RequestLimits &limits)
{
	const auto root = ParseObject(body);

	const auto &text = GetRequiredString(root, "text"sv);
	if (text.size() > limits.max_text_length)
		throw ValidationError("text"sv,
				      fmt::format("Longer than {} bytes"sv,
						  limits.max_text_length));

	return text;
}

void
to_json(nlohmann::json &j, const TranslationResult &result)
{
	j = nlohmann::json{
		{"text", result.text},
	};

	if (!result.detected_source.empty())
		j.emplace("detected_source", result.detected_source);
}

void
to_json(nlohmann::json &j, const DetectResult &result)
{
	j = nlohmann::json{
		{"language", result.language},
		{"confidence", result.confidence},
	};
}

void
to_json(nlohmann::json &j, const LanguageInfo &language)
{
	j = nlohmann::json{
		{"code", language.code},
		{"name", language.name},
		{"direction", ToString(language.direction)},
		{"supports_transliteration", language.supports_transliteration},
	};
}

void
to_json(nlohmann::json &j, const UnitFailure &failure)
{
	j = nlohmann::json{
		{"index", failure.index},
		{"kind", ToString(failure.kind)},
		{"retryable", failure.kind == ProviderErrorKind::TRANSIENT},
		{"message", failure.message},
	};

	if (!failure.provider_id.empty())
		j.emplace("provider", failure.provider_id);
}

std::string
DumpJson(const nlohmann::json &j)
{
	return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string
FormatTranslateResponse(std::span<const TranslationResult> translations)
{
	nlohmann::json array = nlohmann::json::array();
	for (const auto &i : translations)
		array.push_back(i);

	const nlohmann::json root{
		{"translations", std::move(array)},
	};

	return DumpJson(root);
}
