// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "Logger.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "auth/Hash.hxx"
#include "curl/Init.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

#include <stdlib.h>
#include <stdio.h>

int
main(int argc, char **argv)
try {
	CommandLine cmdline;

	try {
		ParseCommandLine(cmdline, argc, argv);
	} catch (const CommandLineError &e) {
		fmt::print(stderr, "{}: {}\nTry '{} --help' for more information.\n",
			   argv[0], e.what(), argv[0]);
		return EXIT_FAILURE;
	}

	switch (cmdline.action) {
	case CommandLine::Action::RUN:
		break;

	case CommandLine::Action::HELP:
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;

	case CommandLine::Action::VERSION:
		fmt::print("lingo-gateway v{}\n", LINGO_GATEWAY_VERSION);
		return EXIT_SUCCESS;

	case CommandLine::Action::HASH_KEY:
		fmt::print("{}\n", HashApiKey(cmdline.hash_key));
		return EXIT_SUCCESS;
	}

	Logger::SetVerbosity(cmdline.verbosity);

	/* configuration */

	GatewayConfig config;
	LoadConfigFile(config, cmdline.config_file.c_str());
	config.ApplyEnvironment();
	cmdline.ApplySettings(config);
	config.Finish();

	/* initialize */

	const ScopeCurlInit curl_init;

	Instance instance;
	instance.Setup(config);

	/* main loop */

	instance.Run();

	return EXIT_SUCCESS;
} catch (...) {
	fmt::print(stderr, "{}\n", GetFullMessage(std::current_exception()));
	return EXIT_FAILURE;
}
