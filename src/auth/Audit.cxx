// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Audit.hxx"
#include "Identity.hxx"

const char *
ToString(AuthFailure failure) noexcept
{
	switch (failure) {
	case AuthFailure::MISSING:
		return "missing";

	case AuthFailure::UNKNOWN:
		return "unknown";

	case AuthFailure::STORE_ERROR:
		return "store_error";

	case AuthFailure::TIMEOUT:
		return "timeout";
	}

	return "unknown";
}

/**
 * Only a prefix of the key hash is logged.
 */
static std::string_view
ShortenHash(std::string_view key_hash) noexcept
{
	return key_hash.substr(0, 12);
}

void
LoggingAuditHandler::OnAuthenticated(const Identity &identity) noexcept
{
	logger(4, "authenticated subject='", identity.subject,
	       "' key=", ShortenHash(identity.key_hash));
}

void
LoggingAuditHandler::OnAuthenticationFailed(AuthFailure failure,
					    std::string_view key_hash) noexcept
{
	if (key_hash.empty())
		logger(3, "rejected: ", ToString(failure));
	else
		logger(2, "rejected: ", ToString(failure),
		       " key=", ShortenHash(key_hash));
}
