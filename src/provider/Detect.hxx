// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string_view>

struct DetectResult;

/**
 * A simple in-process language detector: the dominant Unicode
 * script decides between non-Latin languages, and stop words
 * distinguish the common Latin-script languages.
 *
 * @param text UTF-8 text
 * @return std::nullopt if the language could not be determined
 */
[[gnu::pure]]
std::optional<DetectResult>
DetectLanguage(std::string_view text) noexcept;
