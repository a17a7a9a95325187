// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Calculate the SHA-256 hash of an API key, formatted as lower-case
 * hex.  This is the form in which keys are stored in the credential
 * store.  Throws on OpenSSL error.
 */
std::string
HashApiKey(std::string_view key);

/**
 * Does the given string look like the output of HashApiKey()?
 */
[[gnu::pure]]
bool
IsKeyHash(std::string_view s) noexcept;
