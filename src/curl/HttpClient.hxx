// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"
#include "http/Status.hxx"

#include <chrono>
#include <string>
#include <vector>

class CancelFlag;
class CurlSlist;
class CurlEasy;

struct HttpClientRequest {
	HttpMethod method = HttpMethod::GET;

	std::string uri;

	/**
	 * Additional request headers in the form "Name: value".
	 */
	std::vector<std::string> headers;

	/**
	 * The request body; ignored for GET.
	 */
	std::string body;

	std::string content_type = "application/json";

	/**
	 * The maximum duration of the whole transfer; zero means no
	 * limit.
	 */
	std::chrono::milliseconds timeout{};

	/**
	 * If set, the transfer is aborted as soon as this flag gets
	 * cancelled.
	 */
	const CancelFlag *cancel = nullptr;
};

struct HttpClientResponse {
	HttpStatus status;

	std::string content_type;

	std::string body;
};

/**
 * A simple blocking HTTP client on top of libCURL.  One instance may
 * be used by several threads concurrently, because each request
 * creates its own CURL handle.
 */
class HttpClient {
	const std::string user_agent;

	bool verbose = false;

public:
	explicit HttpClient(std::string_view _user_agent) noexcept
		:user_agent(_user_agent) {}

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;

	void EnableVerbose() noexcept {
		verbose = true;
	}

	/**
	 * Send the request and wait for the response.  Throws
	 * #CurlError on transport failure and #RequestCancelled if the
	 * cancel flag was set.
	 */
	HttpClientResponse Request(const HttpClientRequest &request);

private:
	CurlEasy PrepareRequest(const HttpClientRequest &request,
				CurlSlist &header_list);
};
