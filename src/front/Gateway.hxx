// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Json.hxx"
#include "Logger.hxx"

#include <chrono>

struct GatewayRequest;
struct GatewayResponse;
struct RequestContext;
class CancelFlag;
class Authenticator;
class RateLimiter;
class BatchCoordinator;
class SpeechDelegate;
class MetricsHandler;

struct GatewayOptions {
	RequestLimits limits;

	/**
	 * The maximum duration of one request; zero means no limit.
	 */
	std::chrono::milliseconds request_timeout{30000};

	/**
	 * Include the exception messages in "500 Internal Server Error"
	 * responses?
	 */
	bool verbose_response = false;
};

/**
 * The request pipeline of the REST API: routing, authentication,
 * rate limiting, request parsing and response generation.  This
 * class is independent of the HTTP server library; it is fed with
 * #GatewayRequest objects in worker threads.
 */
class Gateway {
	const GatewayOptions options;

	Authenticator &authenticator;
	RateLimiter &limiter;
	BatchCoordinator &coordinator;

	/**
	 * May be nullptr if speech conversion is not available.
	 */
	SpeechDelegate *const speech;

	/**
	 * May be nullptr.
	 */
	MetricsHandler *const metrics;

	const Logger logger{"gateway"};

public:
	Gateway(const GatewayOptions &_options,
		Authenticator &_authenticator, RateLimiter &_limiter,
		BatchCoordinator &_coordinator,
		SpeechDelegate *_speech=nullptr,
		MetricsHandler *_metrics=nullptr) noexcept
		:options(_options),
		 authenticator(_authenticator), limiter(_limiter),
		 coordinator(_coordinator),
		 speech(_speech), metrics(_metrics) {}

	Gateway(const Gateway &) = delete;
	Gateway &operator=(const Gateway &) = delete;

	/**
	 * Handle one request.  May be called from any thread.  Errors
	 * are converted to an error response.
	 *
	 * @param cancel an optional flag which gets set when the client
	 * disconnects
	 */
	GatewayResponse Handle(const GatewayRequest &request,
			       CancelFlag *cancel) noexcept;

private:
	GatewayResponse Dispatch(const GatewayRequest &request,
				 const RequestContext &ctx);

	void Admit(const GatewayRequest &request, const RequestContext &ctx);

	GatewayResponse HandleTranslate(const GatewayRequest &request,
					const RequestContext &ctx);
	GatewayResponse HandleDetect(const GatewayRequest &request,
				     const RequestContext &ctx);
	GatewayResponse HandleLanguages(const RequestContext &ctx);

	GatewayResponse OnError(const GatewayRequest &request,
				std::exception_ptr ep) noexcept;
};
