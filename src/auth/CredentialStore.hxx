// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * Resolves API key hashes to subjects.
 */
class CredentialStore {
public:
	virtual ~CredentialStore() noexcept = default;

	/**
	 * Does Lookup() possibly wait for I/O?  If yes, the
	 * #Authenticator calls it in a helper thread and stops waiting
	 * after the timeout.
	 */
	virtual bool IsBlocking() const noexcept {
		return true;
	}

	/**
	 * Throws on error.  Implementations must return (or throw)
	 * within the given timeout; a late answer is discarded.  This
	 * method may be called from several threads at once.
	 *
	 * @param key_hash the SHA-256 hash of the API key (lower-case
	 * hex)
	 * @param timeout the maximum time this call may take
	 * @return the subject or std::nullopt if the key is not known
	 */
	virtual std::optional<std::string> Lookup(std::string_view key_hash,
						  std::chrono::milliseconds timeout) = 0;
};
