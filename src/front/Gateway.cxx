// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Gateway.hxx"
#include "Error.hxx"
#include "Json.hxx"
#include "Request.hxx"
#include "Speech.hxx"
#include "HttpMessageResponse.hxx"
#include "MetricsHandler.hxx"
#include "auth/Authenticator.hxx"
#include "auth/Error.hxx"
#include "auth/Identity.hxx"
#include "coordinator/BatchCoordinator.hxx"
#include "limit/Error.hxx"
#include "limit/RateLimiter.hxx"
#include "translation/Context.hxx"
#include "translation/Error.hxx"
#include "translation/Unit.hxx"
#include "util/Exception.hxx"

#include <lingo-gateway/Protocol.hxx>

#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

enum class Route {
	NONE,
	TRANSLATE,
	DETECT,
	LANGUAGES,
	TEXT_TO_SPEECH,
	SPEECH_TO_TEXT,
};

[[gnu::pure]]
static Route
FindRoute(std::string_view path) noexcept
{
	using namespace LingoGateway;

	if (path == TRANSLATE_PATH)
		return Route::TRANSLATE;
	else if (path == DETECT_PATH)
		return Route::DETECT;
	else if (path == LANGUAGES_PATH)
		return Route::LANGUAGES;
	else if (path == TEXT_TO_SPEECH_PATH)
		return Route::TEXT_TO_SPEECH;
	else if (path == SPEECH_TO_TEXT_PATH)
		return Route::SPEECH_TO_TEXT;
	else
		return Route::NONE;
}

[[gnu::const]]
static HttpMethod
GetRouteMethod(Route route) noexcept
{
	return route == Route::LANGUAGES
		? HttpMethod::GET
		: HttpMethod::POST;
}

static GatewayResponse
MakeJsonResponse(const nlohmann::json &root)
{
	GatewayResponse response;
	response.body = DumpJson(root);
	return response;
}

static const char *
GetRejectionKind(std::exception_ptr ep) noexcept
{
	if (FindNested<UnauthorizedError>(ep))
		return LingoGateway::ERROR_UNAUTHORIZED;
	else if (FindNested<ForbiddenError>(ep))
		return LingoGateway::ERROR_FORBIDDEN;
	else if (FindNested<RateLimitedError>(ep))
		return LingoGateway::ERROR_RATE_LIMITED;
	else if (FindNested<ValidationError>(ep))
		return LingoGateway::ERROR_VALIDATION;
	else
		return nullptr;
}

GatewayResponse
Gateway::Handle(const GatewayRequest &request, CancelFlag *cancel) noexcept
{
	try {
		const auto ctx = RequestContext::WithTimeout(options.request_timeout,
							     cancel);
		return Dispatch(request, ctx);
	} catch (...) {
		return OnError(request, std::current_exception());
	}
}

GatewayResponse
Gateway::OnError(const GatewayRequest &request, std::exception_ptr ep) noexcept
{
	if (IsInternalError(ep))
		logger(1, "Request ", request.path, " failed: ", ep);
	else if (FindNested<RequestCancelled>(ep))
		logger(4, "Request ", request.path, " cancelled");
	else
		logger(3, "Request ", request.path, " failed: ", ep);

	if (metrics != nullptr)
		if (const char *kind = GetRejectionKind(ep))
			metrics->OnRejected(kind);

	return ErrorToResponse(ep, options.verbose_response);
}

GatewayResponse
Gateway::Dispatch(const GatewayRequest &request, const RequestContext &ctx)
{
	const auto route = FindRoute(request.path);
	if (route == Route::NONE)
		throw HttpMessageResponse(HttpStatus::NOT_FOUND,
					  LingoGateway::ERROR_NOT_FOUND,
					  "No such resource");

	const auto method = GetRouteMethod(route);
	if (request.method != method) {
		auto response = ErrorToResponse(std::make_exception_ptr(HttpMessageResponse(HttpStatus::METHOD_NOT_ALLOWED,
											   LingoGateway::ERROR_METHOD_NOT_ALLOWED,
											   "Method not allowed")),
						options.verbose_response);
		response.AddHeader("Allow", http_method_to_string(method));
		return response;
	}

	Admit(request, ctx);

	switch (route) {
	case Route::NONE:
		break;

	case Route::TRANSLATE:
		return HandleTranslate(request, ctx);

	case Route::DETECT:
		return HandleDetect(request, ctx);

	case Route::LANGUAGES:
		return HandleLanguages(ctx);

	case Route::TEXT_TO_SPEECH:
	case Route::SPEECH_TO_TEXT:
		if (speech == nullptr)
			throw HttpMessageResponse(HttpStatus::NOT_IMPLEMENTED,
						  LingoGateway::ERROR_NOT_IMPLEMENTED,
						  "Speech conversion is not configured");

		return speech->Convert(route == Route::TEXT_TO_SPEECH
				       ? SpeechOperation::TEXT_TO_SPEECH
				       : SpeechOperation::SPEECH_TO_TEXT,
				       request, ctx);
	}

	throw HttpMessageResponse(HttpStatus::NOT_FOUND,
				  LingoGateway::ERROR_NOT_FOUND,
				  "No such resource");
}

void
Gateway::Admit(const GatewayRequest &request, const RequestContext &ctx)
{
	const auto identity =
		authenticator.Authenticate(request.authorization
					   ? request.authorization->c_str()
					   : nullptr,
					   ctx);

	limiter.Admit(identity, RateLimiter::Clock::now());

	logger(4, "Admitted ", identity.subject, " to ", request.path);
}

GatewayResponse
Gateway::HandleTranslate(const GatewayRequest &request,
			 const RequestContext &ctx)
{
	const auto batch = ParseTranslateRequest(request.body, options.limits);
	const auto translations = coordinator.Translate(batch, ctx);

	GatewayResponse response;
	response.body = FormatTranslateResponse(translations);
	return response;
}

GatewayResponse
Gateway::HandleDetect(const GatewayRequest &request, const RequestContext &ctx)
{
	const auto text = ParseDetectRequest(request.body, options.limits);
	return MakeJsonResponse(coordinator.Detect(text, ctx));
}

GatewayResponse
Gateway::HandleLanguages(const RequestContext &ctx)
{
	return MakeJsonResponse(nlohmann::json{
		{"languages", coordinator.ListLanguages(ctx)},
	});
}
