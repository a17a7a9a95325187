// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Authenticator.hxx"
#include "Audit.hxx"
#include "CredentialStore.hxx"
#include "Error.hxx"
#include "Hash.hxx"
#include "translation/Context.hxx"

#include <exception>
#include <memory>
#include <thread>

#include <strings.h>

Authenticator::~Authenticator() noexcept
{
	std::unique_lock lock{pending_mutex};
	pending_cond.wait(lock, [this]{ return n_pending == 0; });
}

std::string_view
Authenticator::ParseBearer(const char *authorization) noexcept
{
	if (authorization == nullptr)
		return {};

	std::string_view s{authorization};

	static constexpr std::string_view scheme = "bearer";
	if (s.size() <= scheme.size() ||
	    strncasecmp(s.data(), scheme.data(), scheme.size()) != 0 ||
	    (s[scheme.size()] != ' ' && s[scheme.size()] != '\t'))
		return {};

	s.remove_prefix(scheme.size());

	while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
		s.remove_prefix(1);

	while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
		s.remove_suffix(1);

	return s;
}

std::optional<std::string>
Authenticator::LookupBounded(const std::string &key_hash,
			     std::chrono::milliseconds t)
{
	/* shared with the helper thread, which may outlive this call */
	struct Call {
		std::mutex mutex;
		std::condition_variable cond;
		bool done = false;
		std::optional<std::string> result;
		std::exception_ptr error;
	};

	auto call = std::make_shared<Call>();

	{
		const std::scoped_lock lock{pending_mutex};
		++n_pending;
	}

	try {
		std::thread([this, call, key_hash, t]{
			std::optional<std::string> result;
			std::exception_ptr error;

			try {
				result = store.Lookup(key_hash, t);
			} catch (...) {
				error = std::current_exception();
			}

			{
				const std::scoped_lock lock{call->mutex};
				call->result = std::move(result);
				call->error = std::move(error);
				call->done = true;
				call->cond.notify_one();
			}

			/* this is the last access to the Authenticator */
			const std::scoped_lock lock{pending_mutex};
			if (--n_pending == 0)
				pending_cond.notify_all();
		}).detach();
	} catch (...) {
		const std::scoped_lock lock{pending_mutex};
		--n_pending;
		throw;
	}

	std::unique_lock lock{call->mutex};
	if (!call->cond.wait_for(lock, t, [&call]{ return call->done; }))
		throw TimedOut{};

	if (call->error)
		std::rethrow_exception(call->error);

	return std::move(call->result);
}

void
Authenticator::Fail(AuthFailure failure, std::string_view key_hash,
		    const char *msg)
{
	if (audit != nullptr)
		audit->OnAuthenticationFailed(failure, key_hash);

	if (failure == AuthFailure::MISSING)
		throw UnauthorizedError(msg);
	else
		throw ForbiddenError(msg);
}

Identity
Authenticator::Authenticate(const char *authorization,
			    const RequestContext &ctx)
{
	const auto token = ParseBearer(authorization);
	if (token.empty())
		Fail(AuthFailure::MISSING, {}, "Bearer credential required");

	auto key_hash = HashApiKey(token);

	const auto start = std::chrono::steady_clock::now();
	const auto call_timeout = ctx.Clip(timeout, start);

	std::optional<std::string> subject;

	try {
		if (store.IsBlocking())
			subject = LookupBounded(key_hash, call_timeout);
		else
			subject = store.Lookup(key_hash, call_timeout);
	} catch (const TimedOut &) {
		Fail(AuthFailure::TIMEOUT, key_hash,
		     "Credential verification timed out");
	} catch (...) {
		if (audit != nullptr)
			audit->OnAuthenticationFailed(AuthFailure::STORE_ERROR,
						      key_hash);
		std::throw_with_nested(ForbiddenError("Credential verification failed"));
	}

	if (std::chrono::steady_clock::now() - start > call_timeout)
		/* the store has answered, but too late; fail closed */
		Fail(AuthFailure::TIMEOUT, key_hash,
		     "Credential verification timed out");

	if (!subject)
		Fail(AuthFailure::UNKNOWN, key_hash, "Invalid credential");

	Identity identity{std::move(key_hash), std::move(*subject)};

	if (audit != nullptr)
		audit->OnAuthenticated(identity);

	return identity;
}
