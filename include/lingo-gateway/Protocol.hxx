// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the lingo-gateway REST API.
 */

#ifndef LINGO_GATEWAY_PROTOCOL_HXX
#define LINGO_GATEWAY_PROTOCOL_HXX

namespace LingoGateway {

/**
 * POST: translate a batch of texts.
 */
static constexpr char TRANSLATE_PATH[] = "/v1/translate";

/**
 * POST: detect the language of a text.
 */
static constexpr char DETECT_PATH[] = "/v1/detect";

/**
 * GET: list the supported languages.
 */
static constexpr char LANGUAGES_PATH[] = "/v1/languages";

static constexpr char TEXT_TO_SPEECH_PATH[] = "/v1/speech/tts";
static constexpr char SPEECH_TO_TEXT_PATH[] = "/v1/speech/stt";

/*
 * Values of the "kind" attribute of error responses.
 */

static constexpr char ERROR_VALIDATION[] = "validation";
static constexpr char ERROR_UNAUTHORIZED[] = "unauthorized";
static constexpr char ERROR_FORBIDDEN[] = "forbidden";
static constexpr char ERROR_RATE_LIMITED[] = "rate_limited";
static constexpr char ERROR_PARTIAL_FAILURE[] = "partial_failure";
static constexpr char ERROR_TOTAL_FAILURE[] = "total_failure";
static constexpr char ERROR_PROVIDER[] = "provider_error";
static constexpr char ERROR_TIMEOUT[] = "timeout";
static constexpr char ERROR_CANCELLED[] = "cancelled";
static constexpr char ERROR_NOT_FOUND[] = "not_found";
static constexpr char ERROR_METHOD_NOT_ALLOWED[] = "method_not_allowed";
static constexpr char ERROR_NOT_IMPLEMENTED[] = "not_implemented";
static constexpr char ERROR_INTERNAL[] = "internal";

/**
 * The environment variable prefix for configuration overrides.
 */
static constexpr char ENV_PREFIX[] = "LINGO_GATEWAY_";

}

#endif
