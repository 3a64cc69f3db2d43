#pragma once

/**
@file
@brief Core type definitions.

Defines aliases for the fixed-width integer and floating-point types used throughout Tessera.
*/

#include <cstdint>

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

using sint8 = int8_t;
using sint16 = int16_t;
using sint32 = int32_t;
using sint64 = int64_t;

using float32 = float;
using float64 = double;

static_assert(sizeof(float32) == 4, "float is expected to be an IEEE-754 binary32");
static_assert(sizeof(float64) == 8, "double is expected to be an IEEE-754 binary64");
