/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_UTIL_H__
#define __FEATURE_KIT_UTIL_H__

#include "defines.h"
#include "fk_assert.h"
#include "format.h"
#include <cstdlib>
#include <iostream>
#include <type_traits>
#include <utility>

BEGIN_NAMESPACE_FK

template<typename ...T>
void print(format_string<T...> fmt, T&&... args)
{
	std::cerr << fk::format(fmt, std::forward<T>(args)...);
}

template <typename... T>
void println(format_string<T...> fmt, T&&... args)
{
	std::cerr << fk::format(fmt, std::forward<T>(args)...) << '\n';
}

// Progress and summary output is on unless FEATUREKIT_QUIET is set.
INLINE bool verbose_from_env() { return std::getenv("FEATUREKIT_QUIET") == nullptr; }

///////////////////////////////////////////////////

template <typename Y, typename X>
INLINE Y int_cast(X x)
{
	Y y = Y(x);
	FK_CHECK(X(y) == x && ((x < X{}) == (y < Y{})), value, "int_cast: integer overflow when casting {}.", x);
	return y;
}

template <class Enum>
constexpr std::underlying_type_t<Enum> as_ordinal(Enum e) noexcept
{
	return static_cast<std::underlying_type_t<Enum>>(e);
}

END_NAMESPACE_FK

#endif // __FEATURE_KIT_UTIL_H__
