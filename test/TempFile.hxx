// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <stdexcept>
#include <string_view>

#include <stdio.h>

/**
 * A temporary file with the given contents.  It is deleted by the
 * destructor.
 */
class TempFile {
	boost::filesystem::path path;

public:
	explicit TempFile(std::string_view contents)
		:path(boost::filesystem::temp_directory_path() /
		      boost::filesystem::unique_path("lingo-gateway-%%%%-%%%%-%%%%")) {
		FILE *file = fopen(path.c_str(), "w");
		if (file == nullptr)
			throw std::runtime_error("Failed to create " + path.native());

		fwrite(contents.data(), 1, contents.size(), file);
		fclose(file);
	}

	~TempFile() noexcept {
		boost::system::error_code ec;
		boost::filesystem::remove(path, ec);
	}

	TempFile(const TempFile &) = delete;
	TempFile &operator=(const TempFile &) = delete;

	const boost::filesystem::path &GetPath() const noexcept {
		return path;
	}

	const char *c_str() const noexcept {
		return path.c_str();
	}
};
