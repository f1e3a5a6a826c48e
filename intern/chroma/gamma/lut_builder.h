/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include "gamma/table.h"
#include "gamma/transfer_function.h"

#include "util/array.h"
#include "util/types.h"
#include "util/vector.h"

CHROMA_NAMESPACE_BEGIN

/* Gamma Lookup Table Builder
 *
 * Produces the tables and calibration values for a transfer function.
 *
 * The encode tables follow the float to sRGB8 conversion of Fabian Giesen
 * (https://gist.github.com/rygorous/2203834): the input float is split into
 * buckets by its exponent and top mantissa bits, and each bucket stores the
 * scale and bias of a linear fit of the transfer function over it. Instead
 * of summing over every float in a bucket, the fit integrates the transfer
 * function in closed form, see LinearModel.
 *
 * The values returned here only make sense together. GammaLut takes all
 * three from the same builder, code generation must do the same. */
class GammaLutBuilder {
 public:
  explicit GammaLutBuilder(const TransferFunction &transfer_function)
      : transfer_function_(transfer_function)
  {
  }

  const TransferFunction &transfer_function() const
  {
    return transfer_function_;
  }

  /* Encoded to linear, one entry per encoded value. */
  vector<double> u8_to_linear_entries() const;
  vector<double> u16_to_linear_entries() const;

  template<typename V> Lut<V> make_u8_to_linear_lut() const
  {
    return Lut<V>(to_table<V>(u8_to_linear_entries()));
  }

  template<typename V> Lut<V> make_u16_to_linear_lut() const
  {
    return Lut<V>(to_table<V>(u16_to_linear_entries()));
  }

  /* Linear float to encoded 8 bit. */
  array<uint32_t> linear_to_u8_entries() const;
  /* Bit pattern of the largest power of two that encodes to 0. */
  uint32_t linear_to_u8_min_float_bits() const;
  /* Slope of the linear segment in 8 bit space. The 8 bit lookup does not
   * use it, it is kept for symmetry with the 16 bit values. */
  float linear_to_u8_linear_slope() const;

  /* Linear float to encoded 16 bit. */
  array<uint64_t> linear_to_u16_entries() const;
  /* Bit pattern of the largest power of two that either encodes to 0 or lies
   * in the linear segment. */
  uint32_t linear_to_u16_min_float_bits() const;
  /* Slope of the linear segment in 16 bit space, zero for power curves. */
  float linear_to_u16_linear_slope() const;

 private:
  template<typename V> static array<V> to_table(const vector<double> &entries)
  {
    array<V> table(entries.size());
    for (size_t i = 0; i < entries.size(); i++) {
      table[i] = V(entries[i]);
    }
    return table;
  }

  TransferFunction transfer_function_;
};

CHROMA_NAMESPACE_END
