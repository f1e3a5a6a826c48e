/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "testing/testing.h"

#include <cmath>
#include <sstream>

#include "gamma/transfer_function.h"

CHROMA_NAMESPACE_BEGIN

TEST(gamma_transfer_function, power)
{
  const TransferFunction fn = TransferFunction::power(2.2);
  EXPECT_EQ(fn.type(), TRANSFER_FUNCTION_POWER);
  EXPECT_FALSE(fn.has_linear_slope());
  EXPECT_EQ(fn.linear_slope(), 0.0);
  EXPECT_EQ(fn.alpha(), 1.0);
  EXPECT_EQ(fn.beta(), 0.0);
  EXPECT_EQ(fn.gamma(), 2.2);

  EXPECT_EQ(fn.evaluate(0.0), 0.0);
  EXPECT_EQ(fn.evaluate(1.0), 1.0);
  EXPECT_NEAR(fn.evaluate(0.5), std::pow(0.5, 2.2), 1e-15);
  EXPECT_NEAR(fn.encode(0.5), std::pow(0.5, 1.0 / 2.2), 1e-15);
}

TEST(gamma_transfer_function, piecewise_srgb)
{
  const TransferFunction fn = TransferFunction::piecewise(12.92, 0.0031308, 2.4);
  EXPECT_EQ(fn.type(), TRANSFER_FUNCTION_PIECEWISE);
  EXPECT_TRUE(fn.has_linear_slope());
  EXPECT_EQ(fn.linear_slope(), 12.92);
  EXPECT_EQ(fn.beta(), 0.0031308);
  EXPECT_NEAR(fn.alpha(), 1.055, 1e-7);

  /* Linear segment. */
  EXPECT_EQ(fn.encode(0.0), 0.0);
  EXPECT_NEAR(fn.encode(0.001), 0.01292, 1e-15);
  EXPECT_NEAR(fn.evaluate(0.01292), 0.001, 1e-15);

  /* Power segment. */
  EXPECT_NEAR(fn.encode(1.0), 1.0, 1e-12);
  EXPECT_NEAR(fn.evaluate(1.0), 1.0, 1e-12);
  EXPECT_NEAR(fn.evaluate(128.0 / 255.0), 0.21586, 1e-5);
}

TEST(gamma_transfer_function, piecewise_continuity)
{
  const TransferFunction functions[] = {
      TransferFunction::piecewise(12.92, 0.0031308, 2.4),
      TransferFunction::piecewise(4.5, 0.018053968510807, 1.0 / 0.45),
      TransferFunction::piecewise(16.0, 0.001953125, 1.8),
  };

  for (const TransferFunction &fn : functions) {
    const double beta = fn.beta();
    const double linear_piece = fn.linear_slope() * beta;
    const double power_piece = fn.alpha() * std::pow(beta, 1.0 / fn.gamma()) + 1.0 - fn.alpha();
    EXPECT_NEAR(linear_piece, power_piece, 1e-12) << fn;

    /* Both sides of the breakpoint meet. */
    EXPECT_NEAR(fn.encode(beta * (1.0 - 1e-9)), fn.encode(beta * (1.0 + 1e-9)), 1e-9) << fn;
  }
}

TEST(gamma_transfer_function, evaluate_inverts_encode)
{
  const TransferFunction functions[] = {
      TransferFunction::piecewise(12.92, 0.0031308, 2.4),
      TransferFunction::piecewise(4.5, 0.018053968510807, 1.0 / 0.45),
      TransferFunction::power(563.0 / 256.0),
      TransferFunction::power(2.6),
      TransferFunction::piecewise(16.0, 0.001953125, 1.8),
  };

  for (const TransferFunction &fn : functions) {
    for (int i = 0; i <= 1000; i++) {
      const double linear = double(i) / 1000.0;
      EXPECT_NEAR(fn.evaluate(fn.encode(linear)), linear, 1e-12) << fn;
    }
  }
}

TEST(gamma_transfer_function, stream)
{
  std::stringstream power;
  power << TransferFunction::power(2.6);
  EXPECT_EQ(power.str(), "power(gamma=2.6)");

  std::stringstream piecewise;
  piecewise << TransferFunction::piecewise(16.0, 0.001953125, 1.8);
  EXPECT_EQ(piecewise.str(), "piecewise(slope=16, end=0.00195312, gamma=1.8, alpha=1)");
}

CHROMA_NAMESPACE_END
