// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The HTTP server which receives REST API requests and hands them
 * to the #Gateway in a worker thread.
 */

#pragma once

#include "Request.hxx"
#include "Logger.hxx"
#include "thread/Job.hxx"
#include "translation/Cancel.hxx"

#include <boost/intrusive/list.hpp>

#include <chrono>
#include <cstddef>

struct evhttp;
struct evhttp_request;
struct evhttp_connection;
class EventLoop;
class ThreadQueue;
class Gateway;
class Stats;
class HttpFront;

using HttpFrontJobHook =
	boost::intrusive::list_base_hook<boost::intrusive::tag<HttpFront>,
					 boost::intrusive::link_mode<boost::intrusive::normal_link>>;

/**
 * One REST API request which is being handled by a worker thread.
 */
class HttpRequestJob final : public ThreadJob, public HttpFrontJobHook {
	HttpFront &front;

	/**
	 * The libevent request object.  This is nullptr if libevent
	 * has already freed it.
	 */
	struct evhttp_request *req;

	const GatewayRequest request;
	GatewayResponse response;

	CancelFlag cancel;

public:
	HttpRequestJob(HttpFront &_front, struct evhttp_request &_req,
		       GatewayRequest &&_request) noexcept
		:front(_front), req(&_req), request(std::move(_request)) {}

	void Start() noexcept;

	/**
	 * Abandon this request, e.g. because the client has closed
	 * the connection.  If the job is still queued, it is
	 * destroyed immediately; else it will be destroyed by Done().
	 */
	void Abandon() noexcept;

	/**
	 * Abandon this request at shutdown.  The libevent request
	 * object is left to evhttp_free().
	 */
	void Cancel() noexcept;

	/* virtual methods from class ThreadJob */
	void Run() noexcept override;
	void Done() noexcept override;

private:
	void Destroy() noexcept;

	/**
	 * Unregister the close callback from the libevent connection.
	 */
	void ClearCloseCallback() noexcept;

	static void CloseCallback(struct evhttp_connection *evcon,
				  void *ctx) noexcept;
};

class HttpFront {
	friend class HttpRequestJob;

	ThreadQueue &queue;
	Gateway &gateway;
	Stats &stats;

	struct evhttp *const http;

	using JobList = boost::intrusive::list<HttpRequestJob,
					       boost::intrusive::base_hook<HttpFrontJobHook>,
					       boost::intrusive::constant_time_size<true>>;

	/**
	 * All requests which are currently being handled.
	 */
	JobList jobs;

	const Logger logger{"http"};

public:
	/**
	 * Throws on error.
	 *
	 * @param max_body_size the maximum size of a request body;
	 * larger requests are rejected by the HTTP server library
	 * @param timeout the idle timeout of client connections
	 */
	HttpFront(EventLoop &event_loop, ThreadQueue &_queue,
		  Gateway &_gateway, Stats &_stats,
		  std::size_t max_body_size, std::chrono::seconds timeout);

	~HttpFront() noexcept;

	HttpFront(const HttpFront &) = delete;
	HttpFront &operator=(const HttpFront &) = delete;

	/**
	 * Listen on the specified address.  Throws on error.
	 *
	 * @param address a string in the form "HOST:PORT"; the host
	 * may be "*" (all IPv4 addresses) or an IPv6 address in square
	 * brackets
	 */
	void Bind(const char *address);

	std::size_t GetJobCount() const noexcept {
		return jobs.size();
	}

	/**
	 * Cancel all requests.  Jobs which are currently running will
	 * finish in the worker thread.  This is called at shutdown.
	 */
	void CancelAll() noexcept;

private:
	void OnRequest(struct evhttp_request &req) noexcept;
	static void RequestCallback(struct evhttp_request *req,
				    void *ctx) noexcept;

	void SendResponse(struct evhttp_request &req,
			  const GatewayResponse &response) noexcept;
};
