// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Initialize libCURL for the lifetime of this object.  Must be
 * constructed in the main thread before any worker thread is
 * started.
 */
class ScopeCurlInit {
public:
	/**
	 * Throws on error.
	 */
	ScopeCurlInit();
	~ScopeCurlInit() noexcept;

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};
