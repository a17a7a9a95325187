// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "util/StringParser.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

class GatewayConfigParser final : public BlockConfigParser {
	GatewayConfig &config;

	class Listener final : public ConfigParser {
		GatewayConfigParser &parent;
		std::string bind_address;

	public:
		explicit Listener(GatewayConfigParser &_parent) noexcept
			:parent(_parent) {}

	protected:
		/* virtual methods from class ConfigParser */
		void ParseLine(LineParser &line) override;
		void Finish() override;
	};

	class Provider final : public ConfigParser {
		GatewayConfigParser &parent;
		ProviderConfig config;

	public:
		Provider(GatewayConfigParser &_parent, std::string_view _name)
			:parent(_parent), config(_name) {}

	protected:
		/* virtual methods from class ConfigParser */
		void ParseLine(LineParser &line) override;
		void Finish() override;
	};

	class Speech final : public ConfigParser {
		SpeechConfig &config;

	public:
		explicit Speech(SpeechConfig &_config) noexcept
			:config(_config) {}

	protected:
		/* virtual methods from class ConfigParser */
		void ParseLine(LineParser &line) override;
	};

public:
	explicit GatewayConfigParser(GatewayConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class BlockConfigParser */
	void ParseTopLine(LineParser &line) override;

private:
	void CreateListener(LineParser &line);
	void CreateProvider(LineParser &line);
};

void
GatewayConfigParser::Listener::ParseLine(LineParser &line)
{
	const auto word = line.ExpectWord();

	if (word == "bind"sv) {
		if (!bind_address.empty())
			throw LineParser::Error("Bind address already specified");

		bind_address = line.ExpectValueAndEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
GatewayConfigParser::Listener::Finish()
{
	if (bind_address.empty())
		throw LineParser::Error("Listener has no bind address");

	parent.config.listeners.emplace_back(std::move(bind_address));

	ConfigParser::Finish();
}

inline void
GatewayConfigParser::CreateListener(LineParser &line)
{
	line.ExpectBlockOpen();
	OpenBlock(std::make_unique<Listener>(*this));
}

void
GatewayConfigParser::Provider::ParseLine(LineParser &line)
{
	const auto word = line.ExpectWord();

	if (word == "type"sv) {
		config.type = ParseProviderType(line.ExpectValueAndEnd().c_str());
	} else if (word == "url"sv) {
		config.url = line.ExpectValueAndEnd();
	} else if (word == "api_key"sv) {
		config.api_key = line.ExpectValueAndEnd();
	} else if (word == "phrase_table"sv) {
		config.phrase_table = line.ExpectValueAndEnd();
	} else if (word == "max_units_per_call"sv) {
		config.max_units_per_call = line.ExpectPositiveIntegerAndEnd();
	} else if (word == "timeout_ms"sv) {
		config.timeout = std::chrono::milliseconds(line.ExpectPositiveIntegerAndEnd());
	} else
		throw LineParser::Error("Unknown option");
}

void
GatewayConfigParser::Provider::Finish()
{
	config.Check();

	auto &providers = parent.config.providers;
	if (std::any_of(providers.begin(), providers.end(),
			[this](const ProviderConfig &i){
				return i.name == config.name;
			}))
		throw LineParser::Error("Duplicate provider name");

	providers.emplace_back(std::move(config));

	ConfigParser::Finish();
}

inline void
GatewayConfigParser::CreateProvider(LineParser &line)
{
	const auto name = line.ExpectValue();
	line.ExpectBlockOpen();

	OpenBlock(std::make_unique<Provider>(*this, name));
}

void
GatewayConfigParser::Speech::ParseLine(LineParser &line)
{
	const auto word = line.ExpectWord();

	if (word == "tts_url"sv) {
		config.tts_url = line.ExpectValueAndEnd();
	} else if (word == "stt_url"sv) {
		config.stt_url = line.ExpectValueAndEnd();
	} else if (word == "api_key"sv) {
		config.api_key = line.ExpectValueAndEnd();
	} else if (word == "timeout_ms"sv) {
		config.timeout = std::chrono::milliseconds(line.ExpectPositiveIntegerAndEnd());
	} else
		throw LineParser::Error("Unknown option");
}

void
GatewayConfigParser::ParseTopLine(LineParser &line)
{
	const auto word = line.ExpectWord();

	if (word == "listener"sv)
		CreateListener(line);
	else if (word == "provider"sv)
		CreateProvider(line);
	else if (word == "credentials"sv)
		config.credentials_path = line.ExpectValueAndEnd();
	else if (word == "speech"sv) {
		line.ExpectBlockOpen();
		OpenBlock(std::make_unique<Speech>(config.speech));
	} else if (word == "set"sv) {
		const auto name = line.ExpectWord();
		line.ExpectSymbol('=');
		const auto value = line.ExpectValueAndEnd();
		config.HandleSet(name, value.c_str());
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(GatewayConfig &config, const char *path)
{
	GatewayConfigParser parser(config);
	ParseConfigFile(path, parser);
}
