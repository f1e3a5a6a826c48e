/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <iosfwd>

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

enum TransferFunctionType {
  /* encoded = linear ^ (1 / gamma) */
  TRANSFER_FUNCTION_POWER,
  /* Linear segment up to a breakpoint, offset power curve above it. */
  TRANSFER_FUNCTION_PIECEWISE,
};

/* Transfer Function
 *
 * Model of a gamma curve between linear light and encoded values, both
 * normalized to [0, 1]. For a piecewise curve with slope S, breakpoint L and
 * exponent G:
 *
 *   encoded = S * linear                               linear <= L
 *             alpha * linear ^ (1 / G) + (1 - alpha)   linear >  L
 *
 * where alpha is chosen so both pieces meet at L. A power curve has
 * alpha = 1 and beta = 0.
 *
 * The evaluation here is exact and slow, it is the reference the lookup
 * tables are built from and validated against. */
class TransferFunction {
 public:
  static TransferFunction power(const double gamma);
  static TransferFunction piecewise(const double linear_slope,
                                    const double linear_end,
                                    const double gamma);

  /* Encoded to linear. */
  double evaluate(const double encoded) const;
  /* Linear to encoded. */
  double encode(const double linear) const;

  TransferFunctionType type() const
  {
    return type_;
  }

  bool has_linear_slope() const
  {
    return type_ == TRANSFER_FUNCTION_PIECEWISE;
  }

  /* Slope of the linear segment, zero for power curves. */
  double linear_slope() const
  {
    return linear_slope_;
  }

  double alpha() const
  {
    return alpha_;
  }

  /* Breakpoint between the linear and power segments, in linear light. */
  double beta() const
  {
    return beta_;
  }

  double gamma() const
  {
    return gamma_;
  }

 private:
  TransferFunction(const TransferFunctionType type,
                   const double linear_slope,
                   const double alpha,
                   const double beta,
                   const double gamma);

  TransferFunctionType type_;
  double linear_slope_;
  double alpha_;
  double beta_;
  double gamma_;
};

std::ostream &operator<<(std::ostream &os, const TransferFunction &fn);

CHROMA_NAMESPACE_END
