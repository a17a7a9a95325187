// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>

/**
 * A transport-level error reported by CURL (connection failure,
 * timeout, ...).
 */
class CurlError : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}

	bool IsTimeout() const noexcept {
		return code == CURLE_OPERATION_TIMEDOUT;
	}
};

namespace Curl {

inline CurlError
MakeError(CURLcode code, const char *prefix)
{
	std::string msg{prefix};
	msg.append(": ");
	msg.append(curl_easy_strerror(code));
	return CurlError(code, msg.c_str());
}

} // namespace Curl
