/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "gamma/transfer_function.h"

#include <cmath>
#include <ostream>

#include "util/log.h"
#include "util/math.h"

CHROMA_NAMESPACE_BEGIN

TransferFunction::TransferFunction(const TransferFunctionType type,
                                   const double linear_slope,
                                   const double alpha,
                                   const double beta,
                                   const double gamma)
    : type_(type), linear_slope_(linear_slope), alpha_(alpha), beta_(beta), gamma_(gamma)
{
}

TransferFunction TransferFunction::power(const double gamma)
{
  DCHECK_GE(gamma, 1.0);
  return TransferFunction(TRANSFER_FUNCTION_POWER, 0.0, 1.0, 0.0, gamma);
}

TransferFunction TransferFunction::piecewise(const double linear_slope,
                                             const double linear_end,
                                             const double gamma)
{
  DCHECK_GE(gamma, 1.0);
  DCHECK_GT(linear_slope, 0.0);
  DCHECK(linear_end > 0.0 && linear_end < 1.0);

  /* Continuity at the breakpoint: S * L == alpha * L ^ (1 / G) + 1 - alpha. */
  const double alpha = (linear_slope * linear_end - 1.0) /
                       (std::pow(linear_end, 1.0 / gamma) - 1.0);

  return TransferFunction(TRANSFER_FUNCTION_PIECEWISE, linear_slope, alpha, linear_end, gamma);
}

double TransferFunction::evaluate(const double encoded) const
{
  DCHECK(!isnan_safe(encoded) && encoded >= 0.0) << "encoded = " << encoded;

  switch (type_) {
    case TRANSFER_FUNCTION_POWER:
      return std::pow(encoded, gamma_);
    case TRANSFER_FUNCTION_PIECEWISE:
      if (encoded <= linear_slope_ * beta_) {
        return encoded / linear_slope_;
      }
      return std::pow((encoded + alpha_ - 1.0) / alpha_, gamma_);
  }

  return 0.0;
}

double TransferFunction::encode(const double linear) const
{
  DCHECK(!isnan_safe(linear) && linear >= 0.0) << "linear = " << linear;

  switch (type_) {
    case TRANSFER_FUNCTION_POWER:
      return std::pow(linear, 1.0 / gamma_);
    case TRANSFER_FUNCTION_PIECEWISE:
      if (linear <= beta_) {
        return linear * linear_slope_;
      }
      return alpha_ * std::pow(linear, 1.0 / gamma_) + 1.0 - alpha_;
  }

  return 0.0;
}

std::ostream &operator<<(std::ostream &os, const TransferFunction &fn)
{
  switch (fn.type()) {
    case TRANSFER_FUNCTION_POWER:
      os << "power(gamma=" << fn.gamma() << ")";
      break;
    case TRANSFER_FUNCTION_PIECEWISE:
      os << "piecewise(slope=" << fn.linear_slope() << ", end=" << fn.beta()
         << ", gamma=" << fn.gamma() << ", alpha=" << fn.alpha() << ")";
      break;
  }
  return os;
}

CHROMA_NAMESPACE_END
