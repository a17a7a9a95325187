// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(const std::exception &e, const char *separator="; ") noexcept;

[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep, const char *separator="; ") noexcept;

/**
 * Find an instance of the specified exception type in the given
 * exception or its nested chain.  Returns nullptr if there is none.
 * The returned pointer is valid as long as the #std::exception_ptr
 * is.
 */
template<typename T>
[[gnu::pure]]
const T *
FindNested(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const T &t) {
		return &t;
	} catch (const std::nested_exception &ne) {
		if (auto nested = ne.nested_ptr())
			return FindNested<T>(nested);
		return nullptr;
	} catch (...) {
		/* a different type without nested exception */
		return nullptr;
	}
}
