// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpGlue.hxx"
#include "Error.hxx"
#include "curl/HttpClient.hxx"
#include "curl/Error.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>

using std::string_view_literals::operator""sv;

/**
 * Extract an error message from a backend error response.  Both
 * {"error":"..."} and {"message":"..."} are understood.
 */
static std::string
GetErrorMessage(std::string_view body) noexcept
{
	const auto root = nlohmann::json::parse(body, nullptr, false);
	if (!root.is_object())
		return {};

	for (const auto key : {"error"sv, "message"sv}) {
		const auto i = root.find(key);
		if (i != root.end() && i->is_string())
			return i->get<std::string>();
	}

	return {};
}

nlohmann::json
RequestJson(HttpClient &client, std::string_view provider_id,
	    const HttpClientRequest &request)
{
	HttpClientResponse response;

	try {
		response = client.Request(request);
	} catch (const CurlError &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::TRANSIENT,
						     provider_id,
						     "Backend request failed"));
	}

	if (!http_status_is_success(response.status)) {
		auto msg = fmt::format("Backend returned status {}",
				       static_cast<unsigned>(response.status));
		if (const auto detail = GetErrorMessage(response.body);
		    !detail.empty()) {
			msg += ": ";
			msg += detail;
		}

		throw ProviderError(ClassifyHttpStatus(response.status),
				    provider_id, msg);
	}

	try {
		return nlohmann::json::parse(response.body);
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::PERMANENT,
						     provider_id,
						     "Malformed backend response"));
	}
}

std::string
JoinUrl(std::string_view base, std::string_view path) noexcept
{
	while (!base.empty() && base.back() == '/')
		base.remove_suffix(1);

	std::string result{base};
	result.append(path);
	return result;
}

std::string
NormalizeLanguageCode(std::string_view code) noexcept
{
	std::string result{code};
	std::transform(result.begin(), result.end(), result.begin(),
		       [](unsigned char ch){
			       return ch >= 'A' && ch <= 'Z' ? char(ch + 'a' - 'A') : char(ch);
		       });
	return result;
}
