// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>

class HttpClient;
struct GatewayRequest;
struct GatewayResponse;
struct RequestContext;

struct SpeechConfig {
	/**
	 * The text-to-speech backend URL; empty if not configured.
	 */
	std::string tts_url;

	/**
	 * The speech-to-text backend URL; empty if not configured.
	 */
	std::string stt_url;

	std::string api_key;

	std::chrono::milliseconds timeout{10000};
};

enum class SpeechOperation {
	TEXT_TO_SPEECH,
	SPEECH_TO_TEXT,
};

/**
 * Forwards speech conversion requests to an external service.  The
 * request body is passed as-is, and so is the response.
 */
class SpeechDelegate {
	const SpeechConfig config;
	HttpClient &client;

public:
	SpeechDelegate(const SpeechConfig &_config, HttpClient &_client) noexcept
		:config(_config), client(_client) {}

	[[gnu::pure]]
	bool IsConfigured(SpeechOperation operation) const noexcept;

	/**
	 * Throws #HttpMessageResponse if the operation is not
	 * configured and #ProviderError if the backend fails.
	 */
	GatewayResponse Convert(SpeechOperation operation,
				const GatewayRequest &request,
				const RequestContext &ctx);

private:
	const std::string &GetUrl(SpeechOperation operation) const noexcept {
		return operation == SpeechOperation::TEXT_TO_SPEECH
			? config.tts_url
			: config.stt_url;
	}
};
