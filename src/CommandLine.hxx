// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct GatewayConfig;

/**
 * The command line was malformed.  The message is meant to be shown
 * together with a hint to "--help".
 */
class CommandLineError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct CommandLine {
	enum class Action : uint_least8_t {
		RUN,
		HELP,
		VERSION,

		/**
		 * Print the hash of #hash_key and exit.
		 */
		HASH_KEY,
	};

	Action action = Action::RUN;

	std::string config_file = "/etc/lingo-gateway/lingo-gateway.conf";

	/**
	 * The "--set" options; they are applied after the configuration
	 * file and the environment.
	 */
	std::vector<std::pair<std::string, std::string>> settings;

	std::string hash_key;

	/**
	 * The #Logger verbosity after "--verbose" and "--quiet".
	 */
	unsigned verbosity = 1;

	/**
	 * Apply the "--set" options.  Throws on error.
	 */
	void ApplySettings(GatewayConfig &config) const;
};

/**
 * Split a "NAME=VALUE" argument.  Throws #CommandLineError.
 */
std::pair<std::string, std::string>
ParseSetting(std::string_view s);

/**
 * Parse the command line.  Throws #CommandLineError.
 */
void
ParseCommandLine(CommandLine &cmdline, int argc, char **argv);

void
PrintUsage(const char *argv0);
