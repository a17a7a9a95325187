// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "provider/Error.hxx"

#include <algorithm>

bool
BatchFailure::IsRetryable() const noexcept
{
	return !failures.empty() &&
		std::all_of(failures.begin(), failures.end(),
			    [](const UnitFailure &f){
				    return f.kind == ProviderErrorKind::TRANSIENT;
			    });
}
