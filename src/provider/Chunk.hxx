// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "translation/Unit.hxx"

#include <algorithm>
#include <cstddef>
#include <span>

/**
 * Do two units share all per-unit parameters, i.e. may they be sent
 * to the backend in one request?
 */
[[gnu::pure]]
inline bool
IsSameRequestShape(const TranslationUnit &a, const TranslationUnit &b) noexcept
{
	return a.source == b.source && a.target == b.target &&
		a.format == b.format;
}

/**
 * Split a sequence of units into chunks of consecutive units with
 * the same request shape, each at most #max_size long (0 means no
 * limit), and invoke the given function for each chunk in order.
 */
template<typename F>
void
ForEachChunk(std::span<const TranslationUnit> units, std::size_t max_size,
	     F &&f)
{
	while (!units.empty()) {
		std::size_t n = 1;
		while (n < units.size() &&
		       (max_size == 0 || n < max_size) &&
		       IsSameRequestShape(units.front(), units[n]))
			++n;

		f(units.first(n));
		units = units.subspan(n);
	}
}
