/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

class TransferFunction;

/* Linear Model
 *
 * Least squares fit of the encode direction of a transfer function over one
 * bucket of float bit patterns [start, end), as
 *
 *   encoded(x) ~= bias + scale * t(x)
 *
 * where t is the position of x in the bucket, in units of 2^-t_width of the
 * bucket width. The sums of the discrete regression are replaced by integrals
 * over the bucket, which are known in closed form for both segments of a
 * transfer function. */
class LinearModel {
 public:
  LinearModel(const TransferFunction &fn,
              const uint32_t start,
              const uint32_t end,
              const uint32_t man_index_width,
              const uint32_t t_width);
  LinearModel(const double scale, const double bias) : scale_(scale), bias_(bias) {}

  double scale() const
  {
    return scale_;
  }

  double bias() const
  {
    return bias_;
  }

  /* Fixed point entries of the 8 and 16 bit encode tables: bias in the high
   * bits, scale in the low 16 or 32 bits. */
  uint32_t to_u8_entry() const;
  uint64_t to_u16_entry() const;

 private:
  double scale_;
  double bias_;
};

CHROMA_NAMESPACE_END
