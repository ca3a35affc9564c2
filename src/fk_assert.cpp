/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "fk_assert.h"
#include "format.h"

BEGIN_NAMESPACE_FK

const char* runtime_error::what() const noexcept
{
	if (!std::empty(buf))
		return buf.c_str();

	const char* const msg = std::runtime_error::what();
	try {
		ccast<decltype(buf)&>(buf) = fk::format("{}:{}: {}", file, line, msg);
		return buf.c_str();
	} catch (const std::exception&) {
		return msg;
	}
}

static void append_nested(const std::exception& e, std::string& out)
{
	if (!out.empty())
		out += "\n  caused by: ";
	out += e.what();
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& inner) {
		append_nested(inner, out);
	}
}

std::string nested_what(const std::exception& e)
{
	std::string out;
	append_nested(e, out);
	return out;
}

END_NAMESPACE_FK
