// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Detect.hxx"
#include "translation/Result.hxx"

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>

using std::string_view_literals::operator""sv;

namespace {

enum class Script : uint_least8_t {
	LATIN,
	CYRILLIC,
	GREEK,
	ARABIC,
	HEBREW,
	DEVANAGARI,
	THAI,
	HANGUL,
	KANA,
	HAN,
	N_SCRIPTS,
	NONE = N_SCRIPTS,
};

struct ScriptRange {
	char32_t first, last;
	Script script;
};

constexpr std::array script_ranges{
	ScriptRange{U'A', U'Z', Script::LATIN},
	ScriptRange{U'a', U'z', Script::LATIN},
	ScriptRange{0xc0, 0x24f, Script::LATIN},
	ScriptRange{0x370, 0x3ff, Script::GREEK},
	ScriptRange{0x400, 0x52f, Script::CYRILLIC},
	ScriptRange{0x590, 0x5ff, Script::HEBREW},
	ScriptRange{0x600, 0x6ff, Script::ARABIC},
	ScriptRange{0x750, 0x77f, Script::ARABIC},
	ScriptRange{0x900, 0x97f, Script::DEVANAGARI},
	ScriptRange{0xe00, 0xe7f, Script::THAI},
	ScriptRange{0x1100, 0x11ff, Script::HANGUL},
	ScriptRange{0x3040, 0x30ff, Script::KANA},
	ScriptRange{0x3400, 0x4dbf, Script::HAN},
	ScriptRange{0x4e00, 0x9fff, Script::HAN},
	ScriptRange{0xac00, 0xd7af, Script::HANGUL},
};

[[gnu::const]]
Script
GetScript(char32_t ch) noexcept
{
	if (ch == 0xd7 || ch == 0xf7)
		/* multiplication and division signs */
		return Script::NONE;

	for (const auto &i : script_ranges)
		if (ch >= i.first && ch <= i.last)
			return i.script;

	return Script::NONE;
}

/**
 * Decode one UTF-8 sequence.  Malformed sequences are skipped byte
 * by byte and yield U+FFFD.
 */
char32_t
NextCodePoint(std::string_view &s) noexcept
{
	const auto b0 = (unsigned char)s.front();
	std::size_t length;
	char32_t ch;

	if (b0 < 0x80) {
		s.remove_prefix(1);
		return b0;
	} else if ((b0 & 0xe0) == 0xc0) {
		length = 2;
		ch = b0 & 0x1f;
	} else if ((b0 & 0xf0) == 0xe0) {
		length = 3;
		ch = b0 & 0x0f;
	} else if ((b0 & 0xf8) == 0xf0) {
		length = 4;
		ch = b0 & 0x07;
	} else {
		s.remove_prefix(1);
		return 0xfffd;
	}

	if (s.size() < length) {
		s.remove_prefix(1);
		return 0xfffd;
	}

	for (std::size_t i = 1; i < length; ++i) {
		const auto b = (unsigned char)s[i];
		if ((b & 0xc0) != 0x80) {
			s.remove_prefix(1);
			return 0xfffd;
		}

		ch = (ch << 6) | (b & 0x3f);
	}

	s.remove_prefix(length);
	return ch;
}

/* a few very frequent words per language; greetings are included so
   short texts get a chance */
constexpr std::string_view en_words[] = {
	"the"sv, "and"sv, "is"sv, "are"sv, "of"sv, "to"sv,
	"in"sv, "it"sv, "you"sv, "this"sv, "that"sv, "with"sv,
	"for"sv, "hello"sv, "thanks"sv, "please"sv, "what"sv,
	"how"sv, "good"sv, "morning"sv
};

constexpr std::string_view es_words[] = {
	"el"sv, "la"sv, "los"sv, "las"sv, "es"sv, "y"sv,
	"de"sv, "que"sv, "en"sv, "un"sv, "una"sv, "por"sv,
	"con"sv, "hola"sv, "gracias"sv, "buenos"sv, "qué"sv,
	"cómo"sv, "está"sv
};

constexpr std::string_view fr_words[] = {
	"le"sv, "la"sv, "les"sv, "est"sv, "et"sv, "de"sv,
	"des"sv, "un"sv, "une"sv, "je"sv, "vous"sv, "nous"sv,
	"pour"sv, "avec"sv, "bonjour"sv, "merci"sv, "être"sv,
	"où"sv, "très"sv
};

constexpr std::string_view de_words[] = {
	"der"sv, "die"sv, "das"sv, "und"sv, "ist"sv,
	"nicht"sv, "ein"sv, "eine"sv, "ich"sv, "sie"sv,
	"mit"sv, "für"sv, "guten"sv, "danke"sv, "bitte"sv,
	"hallo"sv, "auf"sv, "zu"sv
};

constexpr std::string_view it_words[] = {
	"il"sv, "lo"sv, "gli"sv, "è"sv, "e"sv, "di"sv,
	"che"sv, "un"sv, "una"sv, "per"sv, "con"sv, "non"sv,
	"ciao"sv, "grazie"sv, "buongiorno"sv, "sono"sv
};

constexpr std::string_view pt_words[] = {
	"o"sv, "os"sv, "as"sv, "é"sv, "e"sv, "de"sv,
	"que"sv, "um"sv, "uma"sv, "não"sv, "com"sv, "para"sv,
	"olá"sv, "obrigado"sv, "obrigada"sv, "você"sv
};

constexpr std::string_view nl_words[] = {
	"de"sv, "het"sv, "een"sv, "is"sv, "en"sv, "van"sv,
	"niet"sv, "ik"sv, "je"sv, "met"sv, "voor"sv, "dank"sv,
	"goedemorgen"sv, "alsjeblieft"sv
};

struct StopWords {
	const char *language;
	std::span<const std::string_view> words;
};

constexpr std::array stop_words{
	StopWords{"en", en_words},
	StopWords{"es", es_words},
	StopWords{"fr", fr_words},
	StopWords{"de", de_words},
	StopWords{"it", it_words},
	StopWords{"pt", pt_words},
	StopWords{"nl", nl_words},
};

[[gnu::pure]]
std::string
ToLowerAscii(std::string_view s) noexcept
{
	std::string result{s};
	for (auto &ch : result)
		if (ch >= 'A' && ch <= 'Z')
			ch += 'a' - 'A';
	return result;
}

std::optional<DetectResult>
DetectLatin(std::string_view text) noexcept
{
	std::array<unsigned, stop_words.size()> scores{};
	unsigned n_words = 0;

	const auto count_word = [&scores, &n_words](std::string_view w){
		const auto word = ToLowerAscii(w);
		++n_words;

		for (std::size_t i = 0; i < stop_words.size(); ++i)
			if (std::find(stop_words[i].words.begin(),
				      stop_words[i].words.end(),
				      word) != stop_words[i].words.end())
				++scores[i];
	};

	/* a word is a run of Latin letters */
	const char *word_start = nullptr;
	for (std::string_view s = text; !s.empty();) {
		const char *p = s.data();
		if (GetScript(NextCodePoint(s)) == Script::LATIN) {
			if (word_start == nullptr)
				word_start = p;
		} else if (word_start != nullptr) {
			count_word({word_start, std::size_t(p - word_start)});
			word_start = nullptr;
		}
	}

	if (word_start != nullptr)
		count_word({word_start, std::size_t(text.data() + text.size() - word_start)});

	const auto best = std::max_element(scores.begin(), scores.end());
	if (*best == 0)
		return std::nullopt;

	/* ties are resolved by table order */
	const unsigned total = std::max(n_words, *best);
	return DetectResult{
		stop_words[best - scores.begin()].language,
		std::min(1.0, 0.5 + double(*best) / total / 2),
	};
}

[[gnu::pure]]
bool
Contains(std::string_view text, std::initializer_list<std::string_view> needles) noexcept
{
	return std::any_of(needles.begin(), needles.end(),
			   [text](std::string_view n){
				   return text.find(n) != text.npos;
			   });
}

[[gnu::pure]]
const char *
ScriptToLanguage(Script script, std::string_view text,
		 const std::array<unsigned, std::size_t(Script::N_SCRIPTS)> &counts) noexcept
{
	switch (script) {
	case Script::LATIN:
	case Script::NONE:
		break;

	case Script::CYRILLIC:
		/* letters which exist in Ukrainian, but not in Russian */
		return Contains(text, {"і"sv, "ї"sv, "є"sv, "ґ"sv}) ? "uk" : "ru";

	case Script::GREEK:
		return "el";

	case Script::ARABIC:
		/* letters which exist in Persian, but not in Arabic */
		return Contains(text, {"پ"sv, "چ"sv, "ژ"sv, "گ"sv}) ? "fa" : "ar";

	case Script::HEBREW:
		return "he";

	case Script::DEVANAGARI:
		return "hi";

	case Script::THAI:
		return "th";

	case Script::HANGUL:
		return "ko";

	case Script::KANA:
		return "ja";

	case Script::HAN:
		/* Japanese text mixes Kanji with Kana */
		return counts[std::size_t(Script::KANA)] > 0 ? "ja" : "zh";
	}

	return nullptr;
}

} // anonymous namespace

std::optional<DetectResult>
DetectLanguage(std::string_view text) noexcept
{
	std::array<unsigned, std::size_t(Script::N_SCRIPTS)> counts{};
	unsigned n_letters = 0;

	for (std::string_view s = text; !s.empty();) {
		const auto script = GetScript(NextCodePoint(s));
		if (script == Script::NONE)
			continue;

		++counts[std::size_t(script)];
		++n_letters;
	}

	if (n_letters == 0)
		return std::nullopt;

	auto best = std::max_element(counts.begin(), counts.end());
	auto script = Script(best - counts.begin());

	if (script == Script::KANA && counts[std::size_t(Script::HAN)] > 0)
		script = Script::HAN;

	if (script == Script::LATIN)
		return DetectLatin(text);

	const char *language = ScriptToLanguage(script, text, counts);
	if (language == nullptr)
		return std::nullopt;

	const unsigned n = script == Script::HAN
		? counts[std::size_t(Script::HAN)] + counts[std::size_t(Script::KANA)]
		: *best;

	return DetectResult{language, double(n) / n_letters};
}
