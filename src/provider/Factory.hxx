// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <memory>

class TranslationProvider;
class HttpClient;
struct ProviderConfig;

/**
 * Create the #TranslationProvider implementation selected by the
 * configuration.  Throws on error.
 *
 * @param client the HTTP client used by network backends; it must
 * outlive the provider
 */
std::unique_ptr<TranslationProvider>
CreateProvider(const ProviderConfig &config, HttpClient &client);
