// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

static std::string
MakeValidationMessage(std::string_view field, std::string_view reason)
{
	std::string msg{field};
	msg.append(": ");
	msg.append(reason);
	return msg;
}

ValidationError::ValidationError(std::string_view _field,
				 std::string_view reason)
	:std::runtime_error(MakeValidationMessage(_field, reason)),
	 field(_field)
{
}
