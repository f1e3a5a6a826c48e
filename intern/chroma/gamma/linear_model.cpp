/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "gamma/linear_model.h"
#include "gamma/transfer_function.h"

#include <cmath>

#include "util/log.h"
#include "util/math.h"

CHROMA_NAMESPACE_BEGIN

/* Integrals of y and t * y over [start, end] for y = linear_slope * x, with
 * dx = exp_scale * dt. */
static void integrate_linear(const double start_x,
                             const double end_x,
                             const double start_t,
                             const double end_t,
                             const double linear_slope,
                             const double exp_scale,
                             double *integral_y,
                             double *integral_ty)
{
  auto antiderive_y = [&](const double x) { return 0.5 * linear_slope * x * x / exp_scale; };
  auto antiderive_ty = [&](const double x, const double t) {
    return 0.5 * linear_slope * x * x * (t - x / (3.0 * exp_scale)) / exp_scale;
  };

  *integral_y += antiderive_y(end_x) - antiderive_y(start_x);
  *integral_ty += antiderive_ty(end_x, end_t) - antiderive_ty(start_x, start_t);
}

/* Same for y = alpha * x ^ (1 / gamma) + 1 - alpha. */
static void integrate_power(const double start_x,
                            const double end_x,
                            const double start_t,
                            const double end_t,
                            const double alpha,
                            const double gamma,
                            const double exp_scale,
                            double *integral_y,
                            double *integral_ty)
{
  const double one_plus_gamma_inv = 1.0 + 1.0 / gamma;

  auto antiderive_y = [&](const double x, const double t) {
    return alpha * gamma * std::pow(x, one_plus_gamma_inv) / (exp_scale * (1.0 + gamma)) +
           (1.0 - alpha) * t;
  };
  auto antiderive_ty = [&](const double x, const double t) {
    return alpha * gamma * std::pow(x, one_plus_gamma_inv) *
               (t - gamma * x / (exp_scale * (1.0 + 2.0 * gamma))) /
               (exp_scale * (1.0 + gamma)) +
           0.5 * (1.0 - alpha) * t * t;
  };

  *integral_y += antiderive_y(end_x, end_t) - antiderive_y(start_x, start_t);
  *integral_ty += antiderive_ty(end_x, end_t) - antiderive_ty(start_x, start_t);
}

LinearModel::LinearModel(const TransferFunction &fn,
                         const uint32_t start,
                         const uint32_t end,
                         const uint32_t man_index_width,
                         const uint32_t t_width)
{
  DCHECK_LT(start, end);
  DCHECK_GT(start >> 23, man_index_width + t_width);

  const uint32_t beta_bits = __float_as_uint(float(fn.beta()));
  /* Scale between differentials, dx = exp_scale * dt. */
  const double exp_scale = __uint_as_float(((start >> 23) - man_index_width - t_width) << 23);
  const double start_x = __uint_as_float(start);
  const double end_x = __uint_as_float(end);

  /* Exact on buckets entirely inside the linear segment. */
  if (fn.has_linear_slope() && end <= beta_bits) {
    scale_ = fn.linear_slope() * exp_scale;
    bias_ = fn.linear_slope() * start_x;
    return;
  }

  const double max_t = std::ldexp(1.0, int(t_width));

  double integral_y = 0.0;
  double integral_ty = 0.0;
  if (fn.has_linear_slope() && start < beta_bits) {
    /* The bucket straddles the breakpoint. Its t must come from the same
     * double breakpoint the integrals are bounded by, otherwise the two
     * pieces overlap or leave a gap. */
    const double beta = fn.beta();
    const double beta_t = (beta - start_x) / exp_scale;
    integrate_linear(
        start_x, beta, 0.0, beta_t, fn.linear_slope(), exp_scale, &integral_y, &integral_ty);
    integrate_power(
        beta, end_x, beta_t, max_t, fn.alpha(), fn.gamma(), exp_scale, &integral_y, &integral_ty);
  }
  else {
    integrate_power(
        start_x, end_x, 0.0, max_t, fn.alpha(), fn.gamma(), exp_scale, &integral_y, &integral_ty);
  }

  const double max_t2 = max_t * max_t;
  const double integral_t = max_t2 * 0.5;
  const double integral_t2 = max_t2 * max_t / 3.0;

  scale_ = (max_t * integral_ty - integral_t * integral_y) /
           (max_t * integral_t2 - integral_t * integral_t);
  bias_ = (integral_y - scale_ * integral_t) / max_t;
}

uint32_t LinearModel::to_u8_entry() const
{
  const uint32_t scale_uint = saturate_cast<uint32_t>(255.0 * scale_ * 65536.0 + 0.5);
  const uint32_t bias_uint = saturate_cast<uint32_t>((255.0 * bias_ + 0.5) * 128.0 + 0.5) << 9;
  return (bias_uint << 7) | scale_uint;
}

uint64_t LinearModel::to_u16_entry() const
{
  const uint64_t scale_uint = saturate_cast<uint64_t>(65535.0 * scale_ * 4294967296.0 + 0.5);
  const uint64_t bias_uint = saturate_cast<uint64_t>((65535.0 * bias_ + 0.5) * 32768.0 + 0.5)
                             << 17;
  return (bias_uint << 15) | scale_uint;
}

CHROMA_NAMESPACE_END
