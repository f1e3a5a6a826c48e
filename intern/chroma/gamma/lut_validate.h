/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "gamma/lut.h"
#include "gamma/transfer_function.h"

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Comparison of an encode table against the exact transfer function. */
struct GammaLutValidation {
  /* Largest |lookup(evaluate(e)) - e| over all encoded values e. */
  int max_round_trip_error = 0;
  /* Largest |lookup(x) - round(encode(x) * MAX)| over the sampled inputs. */
  int max_accuracy_error = 0;
  /* Number of sampled inputs that encoded lower than the previous one. */
  int monotonic_violations = 0;
  /* Encoded values of 0 and 1, and the largest encoded value. */
  int encoded_zero = 0;
  int encoded_one = 0;
  int encoded_max = 0;

  bool is_valid() const
  {
    return max_round_trip_error <= 1 && max_accuracy_error <= 1 && monotonic_violations == 0 &&
           encoded_zero == 0 && encoded_one == encoded_max;
  }
};

/* Evenly spaced inputs are spread over [0, 1] for 8 bit. For 16 bit the
 * inputs are squared, so the dark end where the linear segment and the
 * smallest buckets are gets sampled more densely. */
template<typename E, typename Table>
GammaLutValidation gamma_lut_validate(const GammaLut<E, Table> &lut,
                                      const TransferFunction &fn,
                                      const int num_samples)
{
  using Output = GammaLutOutput<E>;
  const double max = double(Output::MAX);

  GammaLutValidation result;
  result.encoded_max = Output::MAX;
  result.encoded_zero = lut.lookup(0.0f);
  result.encoded_one = lut.lookup(1.0f);

  for (int encoded = 0; encoded <= int(Output::MAX); encoded++) {
    const float linear = float(fn.evaluate(double(encoded) / max));
    const int error = std::abs(int(lut.lookup(linear)) - encoded);
    result.max_round_trip_error = std::max(result.max_round_trip_error, error);
  }

  int prev = -1;
  for (int i = 0; i <= num_samples; i++) {
    double x = double(i) / double(num_samples);
    if constexpr (Output::BITS > 8) {
      x *= x;
    }
    const float linear = float(x);
    const int encoded = lut.lookup(linear);
    if (encoded < prev) {
      result.monotonic_violations++;
    }
    prev = encoded;

    const int exact = int(std::floor(fn.encode(linear) * max + 0.5));
    result.max_accuracy_error = std::max(result.max_accuracy_error, std::abs(encoded - exact));
  }

  return result;
}

CHROMA_NAMESPACE_END
