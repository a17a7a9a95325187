// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Convert C++ exception to a HTTP response.
 */

#include "Error.hxx"
#include "Json.hxx"
#include "Request.hxx"
#include "HttpMessageResponse.hxx"
#include "auth/Error.hxx"
#include "coordinator/Error.hxx"
#include "limit/Error.hxx"
#include "provider/Error.hxx"
#include "translation/Error.hxx"
#include "util/Exception.hxx"

#include <lingo-gateway/Protocol.hxx>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

using std::string_view_literals::operator""sv;
using namespace LingoGateway;

static nlohmann::json
MakeError(const char *kind, const char *message, bool retryable)
{
	return nlohmann::json{
		{"kind", kind},
		{"message", message},
		{"retryable", retryable},
	};
}

static GatewayResponse
MakeResponse(HttpStatus status, nlohmann::json &&error)
{
	const nlohmann::json root{
		{"error", std::move(error)},
	};

	GatewayResponse response;
	response.status = status;
	response.body = DumpJson(root);
	return response;
}

static GatewayResponse
MakeResponse(HttpStatus status, const char *kind, const char *message,
	     bool retryable=false)
{
	return MakeResponse(status, MakeError(kind, message, retryable));
}

static GatewayResponse
ToResponse(const BatchFailure &e)
{
	const bool retryable = e.IsRetryable();
	const bool partial = dynamic_cast<const PartialFailure *>(&e) != nullptr;

	auto error = MakeError(partial ? ERROR_PARTIAL_FAILURE : ERROR_TOTAL_FAILURE,
			       e.what(), retryable);

	nlohmann::json translations = nlohmann::json::array();
	for (const auto &i : e.GetTranslations()) {
		if (i)
			translations.push_back(*i);
		else
			translations.push_back(nullptr);
	}

	error.emplace("translations", std::move(translations));
	error.emplace("failures", e.GetFailures());

	/* a total failure which consists only of transient errors
	   may go away if the client tries again */
	const HttpStatus status = !partial && retryable
		? HttpStatus::SERVICE_UNAVAILABLE
		: HttpStatus::BAD_GATEWAY;

	return MakeResponse(status, std::move(error));
}

GatewayResponse
ErrorToResponse(std::exception_ptr ep, bool verbose)
{
	if (const auto *e = FindNested<ValidationError>(ep)) {
		auto error = MakeError(ERROR_VALIDATION, e->what(), false);
		error.emplace("field", e->GetField());
		return MakeResponse(HttpStatus::BAD_REQUEST, std::move(error));
	}

	if (const auto *e = FindNested<UnauthorizedError>(ep)) {
		auto response = MakeResponse(HttpStatus::UNAUTHORIZED,
					     ERROR_UNAUTHORIZED, e->what());
		response.AddHeader("WWW-Authenticate", "Bearer");
		return response;
	}

	if (const auto *e = FindNested<ForbiddenError>(ep))
		return MakeResponse(HttpStatus::FORBIDDEN,
				    ERROR_FORBIDDEN, e->what());

	if (const auto *e = FindNested<RateLimitedError>(ep)) {
		const auto retry_after = e->GetRetryAfter();

		auto error = MakeError(ERROR_RATE_LIMITED, e->what(), true);
		error.emplace("retry_after_ms", retry_after.count());

		auto response = MakeResponse(HttpStatus::TOO_MANY_REQUESTS,
					     std::move(error));

		/* round up to full seconds */
		const auto seconds = (retry_after.count() + 999) / 1000;
		response.AddHeader("Retry-After", fmt::format("{}"sv, seconds));
		return response;
	}

	if (const auto *e = FindNested<BatchFailure>(ep))
		return ToResponse(*e);

	if (const auto *e = FindNested<ProviderError>(ep)) {
		auto error = MakeError(ERROR_PROVIDER, e->what(),
				       e->IsRetryable());
		error.emplace("provider", e->GetProviderId());
		return MakeResponse(e->IsRetryable()
				    ? HttpStatus::SERVICE_UNAVAILABLE
				    : HttpStatus::BAD_GATEWAY,
				    std::move(error));
	}

	if (const auto *e = FindNested<RequestTimeout>(ep))
		return MakeResponse(HttpStatus::GATEWAY_TIMEOUT,
				    ERROR_TIMEOUT, e->what(), true);

	if (const auto *e = FindNested<RequestCancelled>(ep))
		/* nobody will see this response */
		return MakeResponse(HttpStatus::REQUEST_TIMEOUT,
				    ERROR_CANCELLED, e->what());

	if (const auto *r = FindNested<HttpMessageResponse>(ep))
		return MakeResponse(r->GetStatus(), r->GetKind(), r->what());

	if (verbose)
		return MakeResponse(HttpStatus::INTERNAL_SERVER_ERROR, ERROR_INTERNAL,
				    GetFullMessage(ep).c_str());

	return MakeResponse(HttpStatus::INTERNAL_SERVER_ERROR, ERROR_INTERNAL,
			    "Internal server error");
}

bool
IsInternalError(std::exception_ptr ep) noexcept
{
	return FindNested<ValidationError>(ep) == nullptr &&
		FindNested<UnauthorizedError>(ep) == nullptr &&
		FindNested<ForbiddenError>(ep) == nullptr &&
		FindNested<RateLimitedError>(ep) == nullptr &&
		FindNested<BatchFailure>(ep) == nullptr &&
		FindNested<ProviderError>(ep) == nullptr &&
		FindNested<RequestTimeout>(ep) == nullptr &&
		FindNested<RequestCancelled>(ep) == nullptr &&
		FindNested<HttpMessageResponse>(ep) == nullptr;
}
