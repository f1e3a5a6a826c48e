/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

/* Math
 *
 * Basic math functions on scalar types, and bit level access to IEEE-754
 * floats, which the lookup tables are indexed by. */

#include <cmath>
#include <cstring>

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Scalar */

chroma_inline_function uint32_t max(const uint32_t a, const uint32_t b)
{
  return (a > b) ? a : b;
}

/* Bit casts. */

chroma_forceinline uint __float_as_uint(const float f)
{
  union {
    uint i;
    float f;
  } u;
  u.f = f;
  return u.i;
}

chroma_forceinline float __uint_as_float(const uint i)
{
  union {
    uint i;
    float f;
  } u;
  u.i = i;
  return u.f;
}

chroma_inline_function uint64_t __double_as_uint64(const double d)
{
  uint64_t i;
  memcpy(&i, &d, sizeof(i));
  return i;
}

/* Versions of functions which are safe for fast math. */
chroma_inline_function bool isnan_safe(const double d)
{
  const uint64_t x = __double_as_uint64(d);
  return (x << 1) > 0xffe0000000000000ull;
}

/* Convert to an unsigned integer type, saturating at both ends of its range.
 * NaN converts to zero. */
template<typename T> chroma_inline_function T saturate_cast(const double d)
{
  if (!(d > 0.0)) {
    return T(0);
  }
  /* The maximum of a 64 bit type is not representable as double, compare
   * against the next power of two instead. */
  constexpr double limit = double(T(1) << (sizeof(T) * 8 - 1)) * 2.0;
  if (d >= limit) {
    return ~T(0);
  }
  return T(d);
}

CHROMA_NAMESPACE_END
