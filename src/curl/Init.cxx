// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Init.hxx"
#include "Error.hxx"

ScopeCurlInit::ScopeCurlInit()
{
	CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
	if (code != CURLE_OK)
		throw Curl::MakeError(code, "CURL initialization failed");
}

ScopeCurlInit::~ScopeCurlInit() noexcept
{
	curl_global_cleanup();
}
