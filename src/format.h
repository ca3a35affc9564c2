/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_FORMAT_H__
#define __FEATURE_KIT_FORMAT_H__

#include "defines.h"
#include <fmt/format.h>

BEGIN_NAMESPACE_FK

// Returns string formatted according to "{}" replacement-field conventions.
using fmt::format;
using fmt::format_string;

END_NAMESPACE_FK

#endif // __FEATURE_KIT_FORMAT_H__
