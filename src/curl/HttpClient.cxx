// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpClient.hxx"
#include "Easy.hxx"
#include "Slist.hxx"
#include "translation/Cancel.hxx"
#include "translation/Error.hxx"

#include <string_view>

/**
 * Responses larger than this are rejected.
 */
static constexpr std::size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

namespace {

struct TransferState {
	std::string body;

	const CancelFlag *cancel;

	bool too_large = false;
};

}

static size_t
WriteFunction(char *ptr, size_t size, size_t nmemb, void *userdata) noexcept
{
	auto &state = *(TransferState *)userdata;
	const std::size_t length = size * nmemb;

	if (state.body.size() + length > MAX_RESPONSE_SIZE) {
		state.too_large = true;
		/* returning a different length aborts the transfer */
		return 0;
	}

	try {
		state.body.append(ptr, length);
	} catch (const std::bad_alloc &) {
		return 0;
	}

	return length;
}

static int
XferInfoFunction(void *userdata, curl_off_t, curl_off_t,
		 curl_off_t, curl_off_t) noexcept
{
	const auto &state = *(const TransferState *)userdata;
	return state.cancel != nullptr && state.cancel->IsCancelled();
}

inline CurlEasy
HttpClient::PrepareRequest(const HttpClientRequest &request,
			   CurlSlist &header_list)
{
	CurlEasy easy{request.uri.c_str()};

	easy.SetOption(CURLOPT_VERBOSE, long(verbose));
	easy.SetOption(CURLOPT_USERAGENT, user_agent.c_str());
	easy.SetOption(CURLOPT_FOLLOWLOCATION, 0L);

	if (request.timeout.count() > 0) {
		easy.SetTimeout(request.timeout);
		easy.SetConnectTimeout(request.timeout);
	}

	if (request.method == HttpMethod::POST) {
		easy.SetPost();
		easy.SetRequestBody(request.body.data(), request.body.size());

		const std::string content_type = "Content-Type: " + request.content_type;
		header_list.Append(content_type.c_str());
	}

	header_list.Append("Accept: application/json");

	for (const auto &i : request.headers)
		header_list.Append(i.c_str());

	easy.SetRequestHeaders(header_list.Get());

	return easy;
}

HttpClientResponse
HttpClient::Request(const HttpClientRequest &request)
{
	if (request.cancel != nullptr && request.cancel->IsCancelled())
		throw RequestCancelled();

	CurlSlist header_list;
	auto easy = PrepareRequest(request, header_list);

	TransferState state{.body = {}, .cancel = request.cancel};
	easy.SetWriteFunction(WriteFunction, &state);
	easy.SetXferInfoFunction(XferInfoFunction, &state);

	CURLcode code = easy.Perform();

	if (code == CURLE_ABORTED_BY_CALLBACK)
		throw RequestCancelled();

	if (state.too_large)
		throw CurlError(CURLE_WRITE_ERROR, "Response body is too large");

	if (code != CURLE_OK)
		throw Curl::MakeError(code, "CURL error");

	const char *content_type = easy.GetContentType();

	return {
		.status = HttpStatus(easy.GetResponseCode()),
		.content_type = content_type != nullptr ? content_type : "",
		.body = std::move(state.body),
	};
}
