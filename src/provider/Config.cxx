// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <stdexcept>

#include <string.h>

ProviderType
ParseProviderType(const char *s)
{
	if (strcmp(s, "cloud") == 0)
		return ProviderType::CLOUD;
	else if (strcmp(s, "self_hosted") == 0)
		return ProviderType::SELF_HOSTED;
	else if (strcmp(s, "on_device") == 0)
		return ProviderType::ON_DEVICE;
	else
		throw std::runtime_error("Unknown provider type");
}

void
ProviderConfig::Check() const
{
	switch (type) {
	case ProviderType::CLOUD:
		if (api_key.empty())
			throw std::runtime_error("Missing 'api_key'");

		[[fallthrough]];

	case ProviderType::SELF_HOSTED:
		if (url.empty())
			throw std::runtime_error("Missing 'url'");
		break;

	case ProviderType::ON_DEVICE:
		if (phrase_table.empty())
			throw std::runtime_error("Missing 'phrase_table'");
		break;
	}
}
