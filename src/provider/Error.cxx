// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "http/Status.hxx"

const char *
ToString(ProviderErrorKind kind) noexcept
{
	switch (kind) {
	case ProviderErrorKind::TRANSIENT:
		return "transient";

	case ProviderErrorKind::PERMANENT:
		return "permanent";
	}

	return "permanent";
}

ProviderErrorKind
ClassifyHttpStatus(HttpStatus status) noexcept
{
	if (status == HttpStatus::REQUEST_TIMEOUT ||
	    status == HttpStatus::TOO_MANY_REQUESTS ||
	    http_status_is_server_error(status))
		return ProviderErrorKind::TRANSIENT;

	return ProviderErrorKind::PERMANENT;
}
