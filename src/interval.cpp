/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "interval.h"
#include "strutil.h"

BEGIN_NAMESPACE_FK

pos_t as_pos(std::string_view s)
{
	return as_int(s);
}

strand_t as_strand(std::string_view s)
{
	if (s == "+" || s == "1" || s == "+1")
		return pos_strand;
	if (s == "-" || s == "-1")
		return neg_strand;
	FK_CHECK(s == "." || s == "?" || s == "0" || s.empty(), value,
			 "Expected strand to be one of '+', '-', '.', '1', '-1', '0' but found \"{}\".", s);
	return unknown_strand;
}

string block_t::as_str() const
{
	return fk::format("[{},{})", start, end);
}

pos_t total_size(const blocks_t& blocks)
{
	pos_t n = 0;
	for (auto& b : blocks)
		n += b.size();
	return n;
}

END_NAMESPACE_FK
