// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

static void
AppendNested(std::string &dest, const std::exception &e,
	     const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		dest += separator;
		dest += nested.what();
		AppendNested(dest, nested, separator);
	} catch (...) {
		dest += separator;
		dest += "Unrecognized nested exception";
	}
}

std::string
GetFullMessage(const std::exception &e, const char *separator) noexcept
{
	std::string result = e.what();
	AppendNested(result, e, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unknown exception";
	}
}
