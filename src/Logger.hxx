// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/Exception.hxx"

#include <fmt/format.h>

#include <concepts>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>

/**
 * A named log domain.  Messages are written to stderr with the
 * domain name as prefix.  The level semantics are the usual ones: 1
 * for errors, 2 for warnings and failed requests, 3 for
 * informational messages and everything above for debugging.
 */
class Logger {
	std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	[[gnu::pure]]
	static bool IsLevelVisible(unsigned level) noexcept;

	static void SetVerbosity(unsigned _verbosity) noexcept;

	[[gnu::pure]]
	static unsigned GetVerbosity() noexcept;

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		if (!IsLevelVisible(level))
			return;

		std::string msg;
		(Append(msg, std::forward<Args>(args)), ...);
		Emit(msg);
	}

private:
	void Emit(std::string_view msg) const noexcept;

	static void Append(std::string &dest, std::string_view s) noexcept {
		dest.append(s);
	}

	static void Append(std::string &dest, const char *s) noexcept {
		dest.append(s);
	}

	static void Append(std::string &dest, std::exception_ptr ep) noexcept {
		dest.append(GetFullMessage(ep));
	}

	static void Append(std::string &dest, const std::exception &e) noexcept {
		dest.append(GetFullMessage(e));
	}

	template<typename T>
	requires std::integral<T> || std::floating_point<T>
	static void Append(std::string &dest, T value) noexcept {
		fmt::format_to(std::back_inserter(dest), "{}", value);
	}
};
