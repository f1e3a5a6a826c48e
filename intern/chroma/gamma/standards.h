/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <atomic>
#include <mutex>

#include "gamma/lut.h"
#include "gamma/lut_builder.h"
#include "gamma/table.h"

#include "util/string.h"
#include "util/types.h"
#include "util/unique_ptr.h"

CHROMA_NAMESPACE_BEGIN

/* Builders for the transfer functions of common RGB standards. */

/* sRGB. */
GammaLutBuilder srgb_lut_builder();
/* Rec. 709 and Rec. 2020 OETF. */
GammaLutBuilder rec_oetf_builder();
/* Adobe RGB (1998). */
GammaLutBuilder adobe_rgb_builder();
/* DCI-P3. */
GammaLutBuilder p3_builder();
/* ProPhoto RGB (ROMM). */
GammaLutBuilder prophoto_rgb_builder();

enum TransferStandard {
  TRANSFER_STANDARD_SRGB = 0,
  TRANSFER_STANDARD_REC_OETF,
  TRANSFER_STANDARD_ADOBE_RGB,
  TRANSFER_STANDARD_P3,
  TRANSFER_STANDARD_PROPHOTO_RGB,

  TRANSFER_STANDARD_NUM,
};

/* Lower case name, as used on the command line and in logs. */
const char *transfer_standard_name(const TransferStandard standard);
/* Case insensitive, TRANSFER_STANDARD_NUM if the name is unknown. */
TransferStandard transfer_standard_from_string(const string &name);
/* Upper case prefix of generated constants, e.g. SRGB. */
string transfer_standard_identifier(const TransferStandard standard);

GammaLutBuilder transfer_standard_builder(const TransferStandard standard);

/* Whether an 8 bit encode table exists for the standard.
 *
 * ProPhoto's smallest power of two input already encodes to 1, so its table
 * can not map 0 to 0. */
bool transfer_standard_has_u8_encode(const TransferStandard standard);

using GammaLutU8 = GammaLut<uint8_t>;
using GammaLutU16 = GammaLut<uint16_t>;

/* Standard Lookup Tables
 *
 * Process wide tables of the standards, each built on first use and then
 * shared read-only by all threads. */
class StandardLuts {
 public:
  static StandardLuts &get()
  {
    static StandardLuts instance;
    return instance;
  }

  /* Requesting an 8 bit encode table of a standard without one is a
   * programming error and aborts. */
  const GammaLutU8 &encode_u8(const TransferStandard standard);
  const GammaLutU16 &encode_u16(const TransferStandard standard);

  const Lut<float> &decode_u8(const TransferStandard standard);
  const Lut<float> &decode_u16(const TransferStandard standard);

  /* Bytes held by the tables built so far. */
  size_t memory_usage() const;

  StandardLuts(StandardLuts const & /*other*/) = delete;
  void operator=(StandardLuts const & /*other*/) = delete;

 private:
  StandardLuts() = default;

  template<typename T> struct Slot {
    std::once_flag once;
    unique_ptr<T> lut;
  };

  Slot<GammaLutU8> encode_u8_[TRANSFER_STANDARD_NUM];
  Slot<GammaLutU16> encode_u16_[TRANSFER_STANDARD_NUM];
  Slot<Lut<float>> decode_u8_[TRANSFER_STANDARD_NUM];
  Slot<Lut<float>> decode_u16_[TRANSFER_STANDARD_NUM];

  std::atomic<size_t> memory_usage_{0};
};

/* Convenience conversions through the shared tables. */

uint8_t linear_to_encoded_u8(const TransferStandard standard, const float linear);
uint16_t linear_to_encoded_u16(const TransferStandard standard, const float linear);
float encoded_to_linear(const TransferStandard standard, const uint8_t encoded);
float encoded_to_linear(const TransferStandard standard, const uint16_t encoded);

CHROMA_NAMESPACE_END
