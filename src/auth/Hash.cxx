// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Hash.hxx"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

std::string
HashApiKey(std::string_view key)
{
	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned md_length;

	if (EVP_Digest(key.data(), key.size(), md, &md_length,
		       EVP_sha256(), nullptr) != 1)
		throw std::runtime_error("EVP_Digest() failed");

	static constexpr char hex_digits[] = "0123456789abcdef";

	std::string result;
	result.reserve(md_length * 2);
	for (unsigned i = 0; i < md_length; ++i) {
		result.push_back(hex_digits[md[i] >> 4]);
		result.push_back(hex_digits[md[i] & 0xf]);
	}

	return result;
}

static constexpr bool
IsLowerHexDigit(char ch) noexcept
{
	return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

bool
IsKeyHash(std::string_view s) noexcept
{
	return s.size() == 64 && std::all_of(s.begin(), s.end(), IsLowerHexDigit);
}
