// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Factory.hxx"
#include "Config.hxx"
#include "Cloud.hxx"
#include "SelfHosted.hxx"
#include "OnDevice.hxx"

#include <stdexcept>

std::unique_ptr<TranslationProvider>
CreateProvider(const ProviderConfig &config, HttpClient &client)
{
	config.Check();

	switch (config.type) {
	case ProviderType::CLOUD:
		return std::make_unique<CloudProvider>(client, config);

	case ProviderType::SELF_HOSTED:
		return std::make_unique<SelfHostedProvider>(client, config);

	case ProviderType::ON_DEVICE:
		return std::make_unique<OnDeviceProvider>(config);
	}

	throw std::runtime_error("Unknown provider type");
}
