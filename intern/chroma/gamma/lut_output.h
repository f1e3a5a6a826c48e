/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include "gamma/linear_model.h"

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Bit pattern of the largest float below 1.0, the top of the table range. */
#define GAMMA_LUT_MAX_FLOAT_BITS 0x3f7fffffu
#define GAMMA_LUT_MANTISSA_BITS 23

/* Gamma Lookup Table Output
 *
 * Constants of the encode table layout for each encoded type. They only work
 * together, so they live in one place: a table built for one output type can
 * not be read as another. */
template<typename E> struct GammaLutOutput;

template<> struct GammaLutOutput<uint8_t> {
  /* Type of the packed table entries. */
  using TableValue = uint32_t;

  static constexpr uint8_t MAX = 255;
  static constexpr uint32_t BITS = 8;
  /* Number of mantissa bits used to index into the table. */
  static constexpr uint32_t MAN_INDEX_WIDTH = 3;

  static TableValue pack(const LinearModel &model)
  {
    return model.to_u8_entry();
  }
};

template<> struct GammaLutOutput<uint16_t> {
  using TableValue = uint64_t;

  static constexpr uint16_t MAX = 65535;
  static constexpr uint32_t BITS = 16;
  static constexpr uint32_t MAN_INDEX_WIDTH = 7;

  static TableValue pack(const LinearModel &model)
  {
    return model.to_u16_entry();
  }
};

/* Number of table entries needed to cover [min_float_bits, MAX_FLOAT_BITS]. */
template<typename E> constexpr size_t gamma_lut_table_size(const uint32_t min_float_bits)
{
  return size_t(((GAMMA_LUT_MAX_FLOAT_BITS - min_float_bits) >> GAMMA_LUT_MANTISSA_BITS) + 1)
         << GammaLutOutput<E>::MAN_INDEX_WIDTH;
}

CHROMA_NAMESPACE_END
