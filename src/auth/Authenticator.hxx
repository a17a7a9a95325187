// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Identity.hxx"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

class CredentialStore;
class AuditHandler;
enum class AuthFailure : uint_least8_t;
struct RequestContext;

/**
 * Validates the bearer credential of a request against the
 * #CredentialStore.  All failures of the store are treated as
 * rejection.
 */
class Authenticator {
	CredentialStore &store;

	AuditHandler *const audit;

	/**
	 * The maximum duration of one credential store lookup.
	 */
	const std::chrono::milliseconds timeout;

	/**
	 * Protects #n_pending.
	 */
	std::mutex pending_mutex;
	std::condition_variable pending_cond;

	/**
	 * The number of helper threads which are still inside
	 * CredentialStore::Lookup(), possibly after their caller has
	 * given up.
	 */
	unsigned n_pending = 0;

public:
	Authenticator(CredentialStore &_store,
		      std::chrono::milliseconds _timeout,
		      AuditHandler *_audit=nullptr) noexcept
		:store(_store), audit(_audit), timeout(_timeout) {}

	/**
	 * Waits for abandoned lookups to finish, because they still
	 * refer to the #CredentialStore.
	 */
	~Authenticator() noexcept;

	Authenticator(const Authenticator &) = delete;
	Authenticator &operator=(const Authenticator &) = delete;

	/**
	 * Throws #UnauthorizedError if there is no bearer credential,
	 * #ForbiddenError if it is not valid.
	 *
	 * @param authorization the value of the "Authorization" request
	 * header; nullptr if there is none
	 */
	Identity Authenticate(const char *authorization,
			      const RequestContext &ctx);

	/**
	 * Extract the token from an "Authorization: Bearer" header
	 * value.  The scheme name is case-insensitive.
	 *
	 * @return the token or an empty string if the header does not
	 * contain a bearer credential
	 */
	[[gnu::pure]]
	static std::string_view ParseBearer(const char *authorization) noexcept;

private:
	struct TimedOut {};

	/**
	 * Call CredentialStore::Lookup() in a helper thread and wait at
	 * most the given duration for it.  Throws #TimedOut if the
	 * store did not answer in time, and rethrows the store's
	 * exception.
	 */
	std::optional<std::string> LookupBounded(const std::string &key_hash,
						 std::chrono::milliseconds t);

	[[noreturn]]
	void Fail(AuthFailure failure, std::string_view key_hash,
		  const char *msg);
};
