// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StubCredentialStore.hxx"
#include "auth/Audit.hxx"
#include "auth/Authenticator.hxx"
#include "auth/Error.hxx"
#include "auth/FileCredentialStore.hxx"
#include "auth/Hash.hxx"
#include "auth/Identity.hxx"
#include "translation/Context.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <vector>

using std::string_view_literals::operator""sv;
using namespace std::chrono_literals;

namespace {

struct RecordingAuditHandler final : AuditHandler {
	std::vector<std::string> subjects;
	std::vector<AuthFailure> failures;

	void OnAuthenticated(const Identity &identity) noexcept override {
		subjects.push_back(identity.subject);
	}

	void OnAuthenticationFailed(AuthFailure failure,
				    std::string_view) noexcept override {
		failures.push_back(failure);
	}
};

}

TEST(Authenticator, HashApiKey)
{
	EXPECT_EQ(HashApiKey(""sv),
		  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	EXPECT_EQ(HashApiKey("abc"sv),
		  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

	EXPECT_TRUE(IsKeyHash(HashApiKey("secret"sv)));
	EXPECT_FALSE(IsKeyHash("abc"sv));
	EXPECT_FALSE(IsKeyHash("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"sv));
}

TEST(Authenticator, ParseBearer)
{
	EXPECT_EQ(Authenticator::ParseBearer(nullptr), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer(""), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer("Bearer"), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer("Bearer "), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer("Bearerfoo"), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer("Basic Zm9vOmJhcg=="), ""sv);
	EXPECT_EQ(Authenticator::ParseBearer("Bearer foo"), "foo"sv);
	EXPECT_EQ(Authenticator::ParseBearer("bearer  foo "), "foo"sv);
	EXPECT_EQ(Authenticator::ParseBearer("BEARER\tfoo"), "foo"sv);
}

TEST(Authenticator, Success)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");

	RecordingAuditHandler audit;
	Authenticator authenticator(store, 1s, &audit);

	const auto identity = authenticator.Authenticate("Bearer secret",
							 RequestContext{});
	EXPECT_EQ(identity.subject, "alice");
	EXPECT_EQ(identity.key_hash, HashApiKey("secret"sv));

	ASSERT_EQ(audit.subjects.size(), 1U);
	EXPECT_EQ(audit.subjects.front(), "alice");
	EXPECT_TRUE(audit.failures.empty());
}

TEST(Authenticator, Missing)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");

	RecordingAuditHandler audit;
	Authenticator authenticator(store, 1s, &audit);

	EXPECT_THROW(authenticator.Authenticate(nullptr, RequestContext{}),
		     UnauthorizedError);
	EXPECT_THROW(authenticator.Authenticate("Basic c2VjcmV0", RequestContext{}),
		     UnauthorizedError);

	/* the store is not consulted */
	EXPECT_EQ(store.n_lookups, 0U);

	ASSERT_EQ(audit.failures.size(), 2U);
	EXPECT_EQ(audit.failures[0], AuthFailure::MISSING);
}

TEST(Authenticator, Unknown)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");

	RecordingAuditHandler audit;
	Authenticator authenticator(store, 1s, &audit);

	EXPECT_THROW(authenticator.Authenticate("Bearer wrong", RequestContext{}),
		     ForbiddenError);

	ASSERT_EQ(audit.failures.size(), 1U);
	EXPECT_EQ(audit.failures.front(), AuthFailure::UNKNOWN);
}

/**
 * A failing credential store must never let a request through.
 */
TEST(Authenticator, StoreError)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");
	store.fail = true;

	RecordingAuditHandler audit;
	Authenticator authenticator(store, 1s, &audit);

	try {
		authenticator.Authenticate("Bearer secret", RequestContext{});
		FAIL();
	} catch (...) {
		const auto ep = std::current_exception();
		EXPECT_NE(FindNested<ForbiddenError>(ep), nullptr);
		EXPECT_NE(GetFullMessage(ep).find("unavailable"), std::string::npos);
	}

	ASSERT_EQ(audit.failures.size(), 1U);
	EXPECT_EQ(audit.failures.front(), AuthFailure::STORE_ERROR);
}

TEST(Authenticator, Timeout)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");
	store.delay = 50ms;

	RecordingAuditHandler audit;
	Authenticator authenticator(store, 5ms, &audit);

	EXPECT_THROW(authenticator.Authenticate("Bearer secret", RequestContext{}),
		     ForbiddenError);

	ASSERT_EQ(audit.failures.size(), 1U);
	EXPECT_EQ(audit.failures.front(), AuthFailure::TIMEOUT);
}

TEST(Authenticator, StoreIgnoresTimeout)
{
	StubCredentialStore store;
	store.AddKey("secret", "alice");
	store.delay = 500ms;

	RecordingAuditHandler audit;

	{
		Authenticator authenticator(store, 20ms, &audit);

		const auto start = std::chrono::steady_clock::now();
		EXPECT_THROW(authenticator.Authenticate("Bearer secret",
							RequestContext{}),
			     ForbiddenError);

		/* the caller does not wait for the slow store */
		EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);

		/* the destructor waits for the abandoned lookup */
	}

	EXPECT_EQ(store.n_lookups, 1U);
	ASSERT_EQ(audit.failures.size(), 1U);
	EXPECT_EQ(audit.failures.front(), AuthFailure::TIMEOUT);
	EXPECT_TRUE(audit.subjects.empty());
}

TEST(FileCredentialStore, ParseLine)
{
	FileCredentialStore store;

	const auto hash = HashApiKey("secret"sv);
	std::string line = hash + " alice";
	store.ParseLine(line.data());

	line = HashApiKey("other"sv) + " \"Bob Example\"";
	store.ParseLine(line.data());

	EXPECT_EQ(store.size(), 2U);
	EXPECT_EQ(store.Lookup(hash, 1s), "alice");
	EXPECT_EQ(store.Lookup(HashApiKey("other"sv), 1s), "Bob Example");
	EXPECT_FALSE(store.Lookup(HashApiKey("unknown"sv), 1s));

	line = "not-a-hash alice";
	EXPECT_ANY_THROW(store.ParseLine(line.data()));
}
