// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

/**
 * Owns a mutable copy of the arguments, as getopt_long() wants it.
 */
class Args {
	std::vector<std::string> strings;
	std::vector<char *> pointers;

public:
	Args(std::initializer_list<const char *> args)
		:strings(args.begin(), args.end()) {
		for (auto &i : strings)
			pointers.push_back(i.data());
		pointers.push_back(nullptr);
	}

	int argc() const noexcept {
		return static_cast<int>(strings.size());
	}

	char **argv() noexcept {
		return pointers.data();
	}
};

static CommandLine
Parse(std::initializer_list<const char *> args)
{
	Args a(args);
	CommandLine cmdline;
	ParseCommandLine(cmdline, a.argc(), a.argv());
	return cmdline;
}

}

TEST(CommandLine, Defaults)
{
	const auto cmdline = Parse({"lingo-gateway"});
	EXPECT_EQ(cmdline.action, CommandLine::Action::RUN);
	EXPECT_EQ(cmdline.config_file, "/etc/lingo-gateway/lingo-gateway.conf");
	EXPECT_TRUE(cmdline.settings.empty());
	EXPECT_EQ(cmdline.verbosity, Logger::GetVerbosity());
}

TEST(CommandLine, Options)
{
	const auto cmdline = Parse({"lingo-gateway", "-v", "--verbose",
			"-f", "/tmp/gw.conf",
			"--set", "cache_ttl_seconds=60",
			"-s", "worker_threads=2"});
	EXPECT_EQ(cmdline.action, CommandLine::Action::RUN);
	EXPECT_EQ(cmdline.config_file, "/tmp/gw.conf");
	EXPECT_EQ(cmdline.verbosity, Logger::GetVerbosity() + 2);

	ASSERT_EQ(cmdline.settings.size(), 2U);
	EXPECT_EQ(cmdline.settings[0].first, "cache_ttl_seconds");
	EXPECT_EQ(cmdline.settings[0].second, "60");

	GatewayConfig config;
	cmdline.ApplySettings(config);
	EXPECT_EQ(config.cache_ttl, 60s);
	EXPECT_EQ(config.worker_threads, 2U);

	EXPECT_EQ(Parse({"lingo-gateway", "-v", "-q"}).verbosity, 0U);
}

TEST(CommandLine, Actions)
{
	EXPECT_EQ(Parse({"lingo-gateway", "--help"}).action,
		  CommandLine::Action::HELP);
	EXPECT_EQ(Parse({"lingo-gateway", "-V"}).action,
		  CommandLine::Action::VERSION);

	const auto cmdline = Parse({"lingo-gateway", "--hash-key", "secret"});
	EXPECT_EQ(cmdline.action, CommandLine::Action::HASH_KEY);
	EXPECT_EQ(cmdline.hash_key, "secret");
}

TEST(CommandLine, Errors)
{
	EXPECT_THROW(Parse({"lingo-gateway", "--frobnicate"}), CommandLineError);
	EXPECT_THROW(Parse({"lingo-gateway", "-f"}), CommandLineError);
	EXPECT_THROW(Parse({"lingo-gateway", "extra"}), CommandLineError);
	EXPECT_THROW(Parse({"lingo-gateway", "-s", "novalue"}), CommandLineError);
	EXPECT_THROW(Parse({"lingo-gateway", "-s", "=1"}), CommandLineError);

	const auto cmdline = Parse({"lingo-gateway", "-s", "worker_threads=0"});
	GatewayConfig config;
	EXPECT_THROW(cmdline.ApplySettings(config), std::runtime_error);
}

TEST(CommandLine, ParseSetting)
{
	const auto s = ParseSetting("api_key=a=b");
	EXPECT_EQ(s.first, "api_key");
	EXPECT_EQ(s.second, "a=b");

	EXPECT_EQ(ParseSetting("name=").second, "");
}
