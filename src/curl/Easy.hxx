// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.  Throws on error.
	 */
	explicit CurlEasy(const char *url)
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");

		SetOption(CURLOPT_URL, url);

		/* we're running in a worker thread */
		SetOption(CURLOPT_NOSIGNAL, 1L);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw Curl::MakeError(code, "Failed to set CURL option");
	}

	void SetPost() {
		SetOption(CURLOPT_POST, 1L);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	/**
	 * The buffer must remain valid until the transfer has finished.
	 */
	void SetRequestBody(const void *data, std::size_t size) {
		SetOption(CURLOPT_POSTFIELDS, data);
		SetOption(CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)size);
	}

	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, long(timeout.count()));
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, long(timeout.count()));
	}

	void SetWriteFunction(size_t (*function)(char *, size_t, size_t, void *),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	void SetXferInfoFunction(int (*function)(void *, curl_off_t, curl_off_t,
						 curl_off_t, curl_off_t),
				 void *userdata) {
		SetOption(CURLOPT_XFERINFOFUNCTION, function);
		SetOption(CURLOPT_XFERINFODATA, userdata);
		SetOption(CURLOPT_NOPROGRESS, 0L);
	}

	/**
	 * Run the transfer synchronously.
	 *
	 * @return the CURL result code
	 */
	CURLcode Perform() noexcept {
		return curl_easy_perform(handle);
	}

	[[gnu::pure]]
	long GetResponseCode() const noexcept {
		long code = 0;
		if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK)
			return 0;
		return code;
	}

	[[gnu::pure]]
	const char *GetContentType() const noexcept {
		char *value = nullptr;
		if (curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &value) != CURLE_OK)
			return nullptr;
		return value;
	}
};
