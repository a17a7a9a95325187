// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

/**
 * An authenticated caller.  It lives as long as the request and is
 * never persisted.
 */
struct Identity {
	/**
	 * The SHA-256 hash of the API key (lower-case hex).
	 */
	std::string key_hash;

	/**
	 * The subject the credential store has mapped the key to.  Rate
	 * limits are accounted per subject.
	 */
	std::string subject;
};
