// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "translation/Result.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class ProviderErrorKind : uint_least8_t;

/**
 * Describes why one unit of a batch could not be translated.
 */
struct UnitFailure {
	std::size_t index;

	ProviderErrorKind kind;

	std::string provider_id;

	std::string message;
};

/**
 * Some or all units of a batch have failed.  The successful
 * translations are available at their original positions.
 */
class BatchFailure : public std::runtime_error {
	std::vector<std::optional<TranslationResult>> translations;

	std::vector<UnitFailure> failures;

public:
	BatchFailure(const char *msg,
		     std::vector<std::optional<TranslationResult>> &&_translations,
		     std::vector<UnitFailure> &&_failures)
		:std::runtime_error(msg),
		 translations(std::move(_translations)),
		 failures(std::move(_failures)) {}

	const auto &GetTranslations() const noexcept {
		return translations;
	}

	const auto &GetFailures() const noexcept {
		return failures;
	}

	/**
	 * Would retrying the failed units make sense, i.e. are all
	 * failures transient?
	 */
	[[gnu::pure]]
	bool IsRetryable() const noexcept;
};

/**
 * At least one unit has been translated, but some have failed.
 */
class PartialFailure final : public BatchFailure {
public:
	PartialFailure(std::vector<std::optional<TranslationResult>> &&_translations,
		       std::vector<UnitFailure> &&_failures)
		:BatchFailure("Some translations have failed",
			      std::move(_translations), std::move(_failures)) {}
};

/**
 * No unit could be translated.
 */
class TotalFailure final : public BatchFailure {
public:
	TotalFailure(std::vector<std::optional<TranslationResult>> &&_translations,
		     std::vector<UnitFailure> &&_failures)
		:BatchFailure("All translations have failed",
			      std::move(_translations), std::move(_failures)) {}
};
