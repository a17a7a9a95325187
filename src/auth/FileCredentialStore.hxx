// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CredentialStore.hxx"

#include <boost/filesystem/path.hpp>

#include <map>

/**
 * A #CredentialStore which is loaded from a text file.  Each line
 * contains a key hash and a subject separated by whitespace; lines
 * starting with '#' are ignored.
 */
class FileCredentialStore final : public CredentialStore {
	std::map<std::string, std::string, std::less<>> credentials;

public:
	FileCredentialStore() noexcept = default;

	/**
	 * Throws on error.
	 */
	void Load(const boost::filesystem::path &path);

	/**
	 * Parse one line.  Throws on syntax error.
	 */
	void ParseLine(std::string_view line);

	void Add(std::string_view key_hash, std::string_view subject);

	std::size_t size() const noexcept {
		return credentials.size();
	}

	/* virtual methods from class CredentialStore */
	bool IsBlocking() const noexcept override {
		return false;
	}

	std::optional<std::string> Lookup(std::string_view key_hash,
					  std::chrono::milliseconds timeout) override;
};
