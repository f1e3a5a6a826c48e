/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "testing/testing.h"

#include <thread>

#include "gamma/lut_validate.h"
#include "gamma/standards.h"

CHROMA_NAMESPACE_BEGIN

TEST(gamma_standards, names)
{
  for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
    const TransferStandard standard = TransferStandard(i);
    const string name = transfer_standard_name(standard);
    EXPECT_EQ(transfer_standard_from_string(name), standard);
    EXPECT_EQ(transfer_standard_from_string(string_to_upper(name)), standard);
  }

  EXPECT_EQ(transfer_standard_from_string("sRGB"), TRANSFER_STANDARD_SRGB);
  EXPECT_EQ(transfer_standard_from_string("ProPhoto_RGB"), TRANSFER_STANDARD_PROPHOTO_RGB);
  EXPECT_EQ(transfer_standard_from_string("rec709"), TRANSFER_STANDARD_NUM);
  EXPECT_EQ(transfer_standard_from_string(""), TRANSFER_STANDARD_NUM);
  EXPECT_STREQ(transfer_standard_name(TRANSFER_STANDARD_NUM), "unknown");
}

TEST(gamma_standards, identifier)
{
  EXPECT_EQ(transfer_standard_identifier(TRANSFER_STANDARD_SRGB), "SRGB");
  EXPECT_EQ(transfer_standard_identifier(TRANSFER_STANDARD_REC_OETF), "REC_OETF");
  EXPECT_EQ(transfer_standard_identifier(TRANSFER_STANDARD_ADOBE_RGB), "ADOBE_RGB");
  EXPECT_EQ(transfer_standard_identifier(TRANSFER_STANDARD_P3), "P3");
  EXPECT_EQ(transfer_standard_identifier(TRANSFER_STANDARD_PROPHOTO_RGB), "PROPHOTO_RGB");
}

TEST(gamma_standards, transfer_functions)
{
  const TransferFunction srgb = transfer_standard_builder(TRANSFER_STANDARD_SRGB)
                                    .transfer_function();
  EXPECT_EQ(srgb.linear_slope(), 12.92);
  EXPECT_EQ(srgb.beta(), 0.0031308);
  EXPECT_EQ(srgb.gamma(), 2.4);
  EXPECT_NEAR(srgb.alpha(), 1.0549999686, 1e-9);

  const TransferFunction rec = transfer_standard_builder(TRANSFER_STANDARD_REC_OETF)
                                   .transfer_function();
  EXPECT_EQ(rec.linear_slope(), 4.5);
  EXPECT_NEAR(rec.alpha(), 1.0992968268, 1e-9);

  const TransferFunction adobe = transfer_standard_builder(TRANSFER_STANDARD_ADOBE_RGB)
                                     .transfer_function();
  EXPECT_EQ(adobe.type(), TRANSFER_FUNCTION_POWER);
  EXPECT_EQ(adobe.gamma(), 563.0 / 256.0);

  const TransferFunction p3 = transfer_standard_builder(TRANSFER_STANDARD_P3).transfer_function();
  EXPECT_EQ(p3.type(), TRANSFER_FUNCTION_POWER);
  EXPECT_EQ(p3.gamma(), 2.6);

  const TransferFunction prophoto = transfer_standard_builder(TRANSFER_STANDARD_PROPHOTO_RGB)
                                        .transfer_function();
  EXPECT_EQ(prophoto.linear_slope(), 16.0);
  EXPECT_EQ(prophoto.beta(), 0.001953125);
  EXPECT_NEAR(prophoto.alpha(), 1.0, 1e-12);
}

TEST(gamma_standards, has_u8_encode)
{
  EXPECT_TRUE(transfer_standard_has_u8_encode(TRANSFER_STANDARD_SRGB));
  EXPECT_TRUE(transfer_standard_has_u8_encode(TRANSFER_STANDARD_REC_OETF));
  EXPECT_TRUE(transfer_standard_has_u8_encode(TRANSFER_STANDARD_ADOBE_RGB));
  EXPECT_TRUE(transfer_standard_has_u8_encode(TRANSFER_STANDARD_P3));
  EXPECT_FALSE(transfer_standard_has_u8_encode(TRANSFER_STANDARD_PROPHOTO_RGB));
}

TEST(gamma_standards, registry_shares_tables)
{
  StandardLuts &luts = StandardLuts::get();

  const GammaLutU8 &a = luts.encode_u8(TRANSFER_STANDARD_SRGB);
  const GammaLutU8 &b = luts.encode_u8(TRANSFER_STANDARD_SRGB);
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(&luts.encode_u16(TRANSFER_STANDARD_P3), &luts.encode_u16(TRANSFER_STANDARD_P3));
  EXPECT_EQ(&luts.decode_u8(TRANSFER_STANDARD_SRGB), &luts.decode_u8(TRANSFER_STANDARD_SRGB));

  EXPECT_GT(luts.memory_usage(), 0u);
}

TEST(gamma_standards, registry_threads)
{
  StandardLuts &luts = StandardLuts::get();
  const GammaLutU16 *results[8];

  vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&luts, &results, i]() {
      results[i] = &luts.encode_u16(TRANSFER_STANDARD_REC_OETF);
    });
  }
  for (std::thread &thread : threads) {
    thread.join();
  }

  for (int i = 1; i < 8; i++) {
    EXPECT_EQ(results[i], results[0]);
  }
  EXPECT_EQ(results[0]->lookup(1.0f), 65535);
}

TEST(gamma_standards, registry_tables_are_valid)
{
  StandardLuts &luts = StandardLuts::get();

  for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
    const TransferStandard standard = TransferStandard(i);
    const TransferFunction fn = transfer_standard_builder(standard).transfer_function();

    if (transfer_standard_has_u8_encode(standard)) {
      const GammaLutValidation validation = gamma_lut_validate(luts.encode_u8(standard), fn, 50000);
      EXPECT_TRUE(validation.is_valid()) << transfer_standard_name(standard);
    }

    const GammaLutValidation validation = gamma_lut_validate(luts.encode_u16(standard), fn, 50000);
    EXPECT_TRUE(validation.is_valid()) << transfer_standard_name(standard);
    EXPECT_EQ(validation.encoded_one, 65535);
  }
}

TEST(gamma_standards, decode_tables)
{
  StandardLuts &luts = StandardLuts::get();

  for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
    const TransferStandard standard = TransferStandard(i);
    const Lut<float> &decode_u8 = luts.decode_u8(standard);
    const Lut<float> &decode_u16 = luts.decode_u16(standard);

    EXPECT_EQ(decode_u8.size(), 256u);
    EXPECT_EQ(decode_u16.size(), 65536u);
    EXPECT_EQ(decode_u8.lookup(uint8_t(0)), 0.0f);
    EXPECT_EQ(decode_u8.lookup(uint8_t(255)), 1.0f);
    EXPECT_EQ(decode_u16.lookup(uint16_t(0)), 0.0f);
    EXPECT_EQ(decode_u16.lookup(uint16_t(65535)), 1.0f);

    for (int e = 1; e < 65536; e++) {
      EXPECT_LE(decode_u16.lookup(uint16_t(e - 1)), decode_u16.lookup(uint16_t(e)));
    }
  }
}

TEST(gamma_standards, conversions)
{
  EXPECT_EQ(linear_to_encoded_u8(TRANSFER_STANDARD_SRGB, 0.5f), 188);
  EXPECT_EQ(linear_to_encoded_u8(TRANSFER_STANDARD_SRGB, 0.18f), 118);
  EXPECT_EQ(linear_to_encoded_u16(TRANSFER_STANDARD_SRGB, 0.5f), 48192);
  EXPECT_NEAR(encoded_to_linear(TRANSFER_STANDARD_SRGB, uint8_t(128)), 0.2158605f, 1e-6f);
  EXPECT_EQ(encoded_to_linear(TRANSFER_STANDARD_SRGB, uint16_t(65535)), 1.0f);

  for (int e = 0; e < 256; e++) {
    const float linear = encoded_to_linear(TRANSFER_STANDARD_SRGB, uint8_t(e));
    EXPECT_WITHIN_ONE(linear_to_encoded_u8(TRANSFER_STANDARD_SRGB, linear), e);
  }
}

TEST(gamma_standards_death, prophoto_u8_encode)
{
  EXPECT_DEATH(StandardLuts::get().encode_u8(TRANSFER_STANDARD_PROPHOTO_RGB),
               "No 8 bit encode table");
}

CHROMA_NAMESPACE_END
