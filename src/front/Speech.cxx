// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Speech.hxx"
#include "Request.hxx"
#include "HttpMessageResponse.hxx"
#include "curl/HttpClient.hxx"
#include "curl/Error.hxx"
#include "provider/Error.hxx"
#include "translation/Cancel.hxx"
#include "translation/Context.hxx"

#include <lingo-gateway/Protocol.hxx>

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

static constexpr std::string_view SPEECH_ID = "speech"sv;

bool
SpeechDelegate::IsConfigured(SpeechOperation operation) const noexcept
{
	return !GetUrl(operation).empty();
}

GatewayResponse
SpeechDelegate::Convert(SpeechOperation operation,
			const GatewayRequest &request,
			const RequestContext &ctx)
{
	const auto &url = GetUrl(operation);
	if (url.empty())
		throw HttpMessageResponse(HttpStatus::NOT_IMPLEMENTED,
					  LingoGateway::ERROR_NOT_IMPLEMENTED,
					  "Speech conversion is not configured");

	const auto now = RequestContext::Clock::now();
	ctx.Check(now);

	HttpClientRequest r;
	r.method = HttpMethod::POST;
	r.uri = url;
	r.body = request.body;
	if (!request.content_type.empty())
		r.content_type = request.content_type;
	if (!config.api_key.empty())
		r.headers.emplace_back(fmt::format("Authorization: Bearer {}"sv,
						   config.api_key));
	r.timeout = ctx.Clip(config.timeout, now);
	r.cancel = ctx.cancel;

	HttpClientResponse response;

	try {
		response = client.Request(r);
	} catch (const CurlError &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::TRANSIENT,
						     SPEECH_ID,
						     "Speech backend request failed"));
	}

	if (!http_status_is_success(response.status))
		throw ProviderError(ClassifyHttpStatus(response.status), SPEECH_ID,
				    fmt::format("Speech backend returned status {}"sv,
						static_cast<unsigned>(response.status)));

	GatewayResponse result;
	result.status = response.status;
	result.content_type = std::move(response.content_type);
	result.body = std::move(response.body);
	return result;
}
