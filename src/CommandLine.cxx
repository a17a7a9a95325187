// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"

#include <fmt/core.h>

#include <getopt.h>

using std::string_view_literals::operator""sv;

static constexpr int OPTION_HASH_KEY = 0x100;

static constexpr struct option long_options[] = {
	{"help", no_argument, nullptr, 'h'},
	{"version", no_argument, nullptr, 'V'},
	{"verbose", no_argument, nullptr, 'v'},
	{"quiet", no_argument, nullptr, 'q'},
	{"config-file", required_argument, nullptr, 'f'},
	{"set", required_argument, nullptr, 's'},
	{"hash-key", required_argument, nullptr, OPTION_HASH_KEY},
	{nullptr, 0, nullptr, 0}
};

void
PrintUsage(const char *argv0)
{
	fmt::print("usage: {} [OPTIONS]\n"
		   "\n"
		   "  -h, --help               show this text\n"
		   "  -V, --version            show the version\n"
		   "  -v, --verbose            log more (may be repeated)\n"
		   "  -q, --quiet              log nothing\n"
		   "  -f, --config-file=FILE   load this configuration file\n"
		   "  -s, --set=NAME=VALUE     override a configuration setting\n"
		   "      --hash-key=KEY       print the credential file hash of KEY\n",
		   argv0);
}

std::pair<std::string, std::string>
ParseSetting(std::string_view s)
{
	const auto eq = s.find('=');
	if (eq == s.npos)
		throw CommandLineError("No '=' found in --set argument");

	if (eq == 0)
		throw CommandLineError("No name found in --set argument");

	return {std::string{s.substr(0, eq)}, std::string{s.substr(eq + 1)}};
}

void
CommandLine::ApplySettings(GatewayConfig &config) const
{
	for (const auto &[name, value] : settings) {
		try {
			config.HandleSet(name, value.c_str());
		} catch (...) {
			std::throw_with_nested(std::runtime_error(fmt::format("Error while parsing \"--set {}\""sv,
									      name)));
		}
	}
}

void
ParseCommandLine(CommandLine &cmdline, int argc, char **argv)
{
	cmdline.verbosity = Logger::GetVerbosity();

	/* rescan from the beginning, and report errors ourselves */
	optind = 0;
	opterr = 0;

	int ret;
	while ((ret = getopt_long(argc, argv, ":hVvqf:s:",
				  long_options, nullptr)) != -1) {
		switch (ret) {
		case 'h':
			cmdline.action = CommandLine::Action::HELP;
			return;

		case 'V':
			cmdline.action = CommandLine::Action::VERSION;
			return;

		case 'v':
			++cmdline.verbosity;
			break;

		case 'q':
			cmdline.verbosity = 0;
			break;

		case 'f':
			cmdline.config_file = optarg;
			break;

		case 's':
			cmdline.settings.emplace_back(ParseSetting(optarg));
			break;

		case OPTION_HASH_KEY:
			cmdline.action = CommandLine::Action::HASH_KEY;
			cmdline.hash_key = optarg;
			break;

		case ':':
			throw CommandLineError(fmt::format("Option '{}' requires an argument"sv,
							   argv[optind - 1]));

		default:
			throw CommandLineError(fmt::format("Unrecognized option '{}'"sv,
							   argv[optind - 1]));
		}
	}

	if (optind < argc)
		throw CommandLineError(fmt::format("Unrecognized argument '{}'"sv,
						   argv[optind]));
}
