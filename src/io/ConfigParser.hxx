// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

class LineParser;

/**
 * Receives the lines of a configuration file, after comments and
 * directives have been handled by #ConfigFileReader.
 */
class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * Called at the end of the top-level file (or at the end of a
	 * block).  Throws if the configuration is incomplete.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which supports "NAME ... {" blocks.  While a block
 * is open, its lines go to the child parser; the closing "}" finishes
 * and destroys it.
 */
class BlockConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> block;

public:
	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) final;
	void Finish() override;

protected:
	/**
	 * Open a block; the caller has already consumed the opening
	 * brace.
	 */
	void OpenBlock(std::unique_ptr<ConfigParser> &&_block) noexcept {
		block = std::move(_block);
	}

	/**
	 * Parse a line outside of any block.
	 */
	virtual void ParseTopLine(LineParser &line) = 0;
};

/**
 * Reads configuration files line by line and feeds them into a
 * #ConfigParser.  Handles these features of the file syntax:
 *
 * - empty lines and lines starting with '#' are ignored
 * - "@set NAME = "VALUE"" defines a variable
 * - "${NAME}" is replaced with the variable's value (except in
 *   single-quoted strings)
 * - "@include "PATH"" reads another file; relative paths are
 *   relative to the including file
 */
class ConfigFileReader {
	ConfigParser &parser;

	std::map<std::string, std::string, std::less<>> variables;

	unsigned include_depth = 0;

public:
	explicit ConfigFileReader(ConfigParser &_parser) noexcept
		:parser(_parser) {}

	/**
	 * Read one file without calling ConfigParser::Finish().
	 * Errors are nested in an exception describing the file name
	 * and line number.
	 */
	void Read(const boost::filesystem::path &path);

	/**
	 * Handle one line.  Throws on error.
	 */
	void HandleLine(const boost::filesystem::path &path,
			std::string_view line);

private:
	void Include(const boost::filesystem::path &base, std::string &&p);

	/**
	 * Throws if the variable is not defined.
	 */
	const std::string &GetVariable(std::string_view name) const;

	/**
	 * Substitute all variable references.  Values inserted outside
	 * of quotes are quoted, so they are parsed as one token.
	 */
	std::string Expand(std::string_view src) const;
};

/**
 * Parse a configuration file and call ConfigParser::Finish().
 * Throws on error.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
