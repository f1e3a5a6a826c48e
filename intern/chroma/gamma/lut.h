/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <type_traits>
#include <utility>

#include "gamma/lut_builder.h"
#include "gamma/lut_output.h"
#include "gamma/table.h"

#include "util/array.h"
#include "util/log.h"
#include "util/math.h"
#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Table path of the lookup, for inputs already clamped to
 * [min_float_bits, GAMMA_LUT_MAX_FLOAT_BITS].
 *
 * The table is indexed without bounds checks: the builder sizes it to cover
 * exactly that range, so the index is in range as long as the table and
 * min_float_bits come from the same builder. */
template<typename E>
chroma_forceinline E gamma_lut_lookup_table(const float input,
                                            const uint32_t min_float_bits,
                                            const typename GammaLutOutput<E>::TableValue *table,
                                            const size_t table_size)
{
  using Output = GammaLutOutput<E>;
  using TableValue = typename Output::TableValue;

  constexpr uint32_t bits = Output::BITS;
  constexpr uint32_t man_index_width = Output::MAN_INDEX_WIDTH;
  constexpr TableValue bits_mask = (TableValue(1) << bits) - 1;
  constexpr TableValue bits_2 = 2 * bits;
  constexpr TableValue bits_2_mask = (TableValue(1) << bits_2) - 1;

  const uint32_t input_bits = __float_as_uint(input);
  DCHECK_LE(min_float_bits, input_bits);
  DCHECK_LE(input_bits, GAMMA_LUT_MAX_FLOAT_BITS);

  const size_t i = (input_bits - min_float_bits) >> (GAMMA_LUT_MANTISSA_BITS - man_index_width);
  DCHECK_LT(i, table_size);
  const TableValue entry = table[i];

  const TableValue bias = (entry >> bits_2) << (bits + 1);
  const TableValue scale = entry & bits_2_mask;
  const TableValue t = (TableValue(input_bits) >>
                        (GAMMA_LUT_MANTISSA_BITS - man_index_width - bits)) &
                       bits_mask;
  const TableValue res = (bias + scale * t) >> bits_2;
  DCHECK_LE(res, TableValue(Output::MAX));

  return E(res);
}

/* Everything at or below the smallest table input encodes to 0. */
chroma_forceinline uint8_t gamma_lut_lookup_u8(const float linear,
                                               const uint32_t min_float_bits,
                                               const uint32_t *table,
                                               const size_t table_size)
{
  const float min_float = __uint_as_float(min_float_bits);
  const float max_float = __uint_as_float(GAMMA_LUT_MAX_FLOAT_BITS);

  float input = linear;
  /* Written so NaN takes the first branch. */
  if (!(input > min_float)) {
    input = min_float;
  }
  else if (input > max_float) {
    input = max_float;
  }

  return gamma_lut_lookup_table<uint8_t>(input, min_float_bits, table, table_size);
}

/* Inputs below the smallest table input are in the linear segment, or small
 * enough to round to 0, and are scaled directly. */
chroma_forceinline uint16_t gamma_lut_lookup_u16(const float linear,
                                                 const float linear_slope,
                                                 const uint32_t min_float_bits,
                                                 const uint64_t *table,
                                                 const size_t table_size)
{
  const float min_float = __uint_as_float(min_float_bits);
  const float max_float = __uint_as_float(GAMMA_LUT_MAX_FLOAT_BITS);

  float input = linear;
  if (!(input > 0.0f)) {
    input = 0.0f;
  }
  else if (input > max_float) {
    input = max_float;
  }

  if (input < min_float) {
    /* Adding 2^23 rounds to an integer in the low mantissa bits. */
    const float scaled = linear_slope * input;
    return uint16_t(__float_as_uint(scaled + 8388608.0f) & 65535);
  }

  return gamma_lut_lookup_table<uint16_t>(input, min_float_bits, table, table_size);
}

/* Gamma Lookup Table
 *
 * Converts linear float values to 8 or 16 bit encoded values through a table
 * built by GammaLutBuilder. E is the encoded type, Table the storage of the
 * packed entries. Immutable after construction and safe to share between
 * threads. */
template<typename E, typename Table = array<typename GammaLutOutput<E>::TableValue>>
class GammaLut {
 public:
  using Output = GammaLutOutput<E>;
  using TableValue = typename Output::TableValue;

  /* Build the table at run time. */
  static GammaLut from_builder(const GammaLutBuilder &builder)
  {
    static_assert(std::is_constructible_v<Table, array<TableValue> &&>,
                  "from_builder needs owned table storage");

    if constexpr (std::is_same_v<E, uint8_t>) {
      return GammaLut(builder.linear_to_u8_min_float_bits(),
                      builder.linear_to_u8_linear_slope(),
                      Table(builder.linear_to_u8_entries()));
    }
    else {
      static_assert(std::is_same_v<E, uint16_t>, "encoded type must be uint8_t or uint16_t");
      return GammaLut(builder.linear_to_u16_min_float_bits(),
                      builder.linear_to_u16_linear_slope(),
                      Table(builder.linear_to_u16_entries()));
    }
  }

  /* Assemble a table from precomputed values, used by generated code.
   *
   * All three values must come from the same GammaLutBuilder, for the same
   * encoded type and CHROMA_LUT_FORMAT_VERSION. Anything else makes lookup
   * read outside the table. */
  static constexpr GammaLut from_parts(const uint32_t min_float_bits,
                                       const float linear_slope,
                                       Table table)
  {
    return GammaLut(min_float_bits, linear_slope, std::move(table));
  }

  /* Borrow this table without copying it. */
  GammaLut<E, LutRef<Table>> get_ref() const
  {
    return GammaLut<E, LutRef<Table>>::from_parts(
        min_float_bits_, linear_slope_, LutRef<Table>(table_));
  }

  GammaLut<E, LutSlice<TableValue>> get_slice() const
  {
    return GammaLut<E, LutSlice<TableValue>>::from_parts(
        min_float_bits_, linear_slope_, LutSlice<TableValue>(table_.data(), table_.size()));
  }

  E lookup(const float linear) const
  {
    if constexpr (std::is_same_v<E, uint8_t>) {
      return gamma_lut_lookup_u8(linear, min_float_bits_, table_.data(), table_.size());
    }
    else {
      return gamma_lut_lookup_u16(
          linear, linear_slope_, min_float_bits_, table_.data(), table_.size());
    }
  }

  E lookup(const double linear) const
  {
    return lookup(float(linear));
  }

  uint32_t min_float_bits() const
  {
    return min_float_bits_;
  }

  float linear_slope() const
  {
    return linear_slope_;
  }

  const Table &table() const
  {
    return table_;
  }

 private:
  constexpr GammaLut(const uint32_t min_float_bits, const float linear_slope, Table table)
      : table_(std::move(table)), min_float_bits_(min_float_bits), linear_slope_(linear_slope)
  {
  }

  Table table_;
  uint32_t min_float_bits_;
  float linear_slope_;
};

CHROMA_NAMESPACE_END
