// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct TranslationUnit;
struct BatchOptions;
struct ProviderResult;
struct DetectResult;
struct LanguageInfo;
class CancelFlag;

/**
 * Limits for one provider call.
 */
struct CallContext {
	/**
	 * The maximum duration of the call; zero means no limit.
	 */
	std::chrono::milliseconds timeout{};

	/**
	 * If set, the call shall be abandoned as soon as this flag gets
	 * cancelled.
	 */
	const CancelFlag *cancel = nullptr;
};

/**
 * The uniform interface to a translation backend.  All methods are
 * blocking, they are called from worker threads, and implementations
 * must allow concurrent calls.
 *
 * Errors are reported by throwing #ProviderError; #RequestCancelled
 * is thrown if the call was cancelled.
 */
class TranslationProvider {
public:
	virtual ~TranslationProvider() noexcept = default;

	[[gnu::pure]]
	virtual const std::string &GetId() const noexcept = 0;

	/**
	 * Translate a sequence of units.  Splitting the sequence to fit
	 * the backend's transport limits is up to the implementation.
	 *
	 * @return one result per unit, in the same order
	 */
	virtual std::vector<ProviderResult> TranslateBatch(std::span<const TranslationUnit> units,
							   const BatchOptions &options,
							   const CallContext &ctx) = 0;

	virtual DetectResult Detect(std::string_view text,
				    const CallContext &ctx) = 0;

	virtual std::vector<LanguageInfo> ListLanguages(const CallContext &ctx) = 0;
};
