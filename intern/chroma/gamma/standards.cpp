/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "gamma/standards.h"
#include "gamma/lut_validate.h"

#include "util/debug.h"
#include "util/log.h"
#include "util/string.h"
#include "util/time.h"

CHROMA_NAMESPACE_BEGIN

GammaLutBuilder srgb_lut_builder()
{
  return GammaLutBuilder(TransferFunction::piecewise(12.92, 0.0031308, 2.4));
}

GammaLutBuilder rec_oetf_builder()
{
  return GammaLutBuilder(TransferFunction::piecewise(4.5, 0.018053968510807, 1.0 / 0.45));
}

GammaLutBuilder adobe_rgb_builder()
{
  return GammaLutBuilder(TransferFunction::power(563.0 / 256.0));
}

GammaLutBuilder p3_builder()
{
  return GammaLutBuilder(TransferFunction::power(2.6));
}

GammaLutBuilder prophoto_rgb_builder()
{
  return GammaLutBuilder(TransferFunction::piecewise(16.0, 0.001953125, 1.8));
}

const char *transfer_standard_name(const TransferStandard standard)
{
  switch (standard) {
    case TRANSFER_STANDARD_SRGB:
      return "srgb";
    case TRANSFER_STANDARD_REC_OETF:
      return "rec_oetf";
    case TRANSFER_STANDARD_ADOBE_RGB:
      return "adobe_rgb";
    case TRANSFER_STANDARD_P3:
      return "p3";
    case TRANSFER_STANDARD_PROPHOTO_RGB:
      return "prophoto_rgb";
    case TRANSFER_STANDARD_NUM:
      break;
  }

  return "unknown";
}

TransferStandard transfer_standard_from_string(const string &name)
{
  for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
    const TransferStandard standard = TransferStandard(i);
    if (string_iequals(name, transfer_standard_name(standard))) {
      return standard;
    }
  }
  return TRANSFER_STANDARD_NUM;
}

string transfer_standard_identifier(const TransferStandard standard)
{
  return string_to_upper(transfer_standard_name(standard));
}

GammaLutBuilder transfer_standard_builder(const TransferStandard standard)
{
  switch (standard) {
    case TRANSFER_STANDARD_SRGB:
      return srgb_lut_builder();
    case TRANSFER_STANDARD_REC_OETF:
      return rec_oetf_builder();
    case TRANSFER_STANDARD_ADOBE_RGB:
      return adobe_rgb_builder();
    case TRANSFER_STANDARD_P3:
      return p3_builder();
    case TRANSFER_STANDARD_PROPHOTO_RGB:
      return prophoto_rgb_builder();
    case TRANSFER_STANDARD_NUM:
      break;
  }

  LOG_FATAL << "Invalid transfer standard " << int(standard);
  return srgb_lut_builder();
}

bool transfer_standard_has_u8_encode(const TransferStandard standard)
{
  return standard != TRANSFER_STANDARD_PROPHOTO_RGB && standard != TRANSFER_STANDARD_NUM;
}

template<typename E>
static void validate_encode_lut(const TransferStandard standard,
                                const GammaLut<E> &lut,
                                const GammaLutBuilder &builder)
{
  if (!DebugFlags().lut.validate) {
    return;
  }

  const GammaLutValidation validation = gamma_lut_validate(
      lut, builder.transfer_function(), 1 << 18);

  const char *name = transfer_standard_name(standard);
  const int bits = GammaLutOutput<E>::BITS;

  if (!validation.is_valid()) {
    LOG_WARNING << "Encode table " << name << " " << bits << " bit differs from "
                << builder.transfer_function() << ": round trip error "
                << validation.max_round_trip_error << ", accuracy error "
                << validation.max_accuracy_error << ", " << validation.monotonic_violations
                << " monotonicity violations, 0 -> " << validation.encoded_zero << ", 1 -> "
                << validation.encoded_one;
    return;
  }

  LOG_STATS << "Encode table " << name << " " << bits << " bit validated, round trip error "
            << validation.max_round_trip_error << ", accuracy error "
            << validation.max_accuracy_error;
}

/* Returns the table size in bytes. */
template<typename T>
static size_t log_table_built(const char *what,
                              const TransferStandard standard,
                              const T &table,
                              const double time)
{
  const size_t bytes = table.size() * sizeof(*table.data());
  LOG_WORK << "Built " << what << " table for " << transfer_standard_name(standard) << " ("
           << string_human_readable_number(table.size()) << " entries, "
           << string_human_readable_size(bytes) << ") in "
           << time_human_readable_from_seconds(time);
  return bytes;
}

static void check_standard(const TransferStandard standard)
{
  CHECK(standard >= 0 && standard < TRANSFER_STANDARD_NUM)
      << "Invalid transfer standard " << int(standard);
}

const GammaLutU8 &StandardLuts::encode_u8(const TransferStandard standard)
{
  check_standard(standard);
  CHECK(transfer_standard_has_u8_encode(standard))
      << "No 8 bit encode table for " << transfer_standard_name(standard);

  Slot<GammaLutU8> &slot = encode_u8_[standard];
  std::call_once(slot.once, [&]() {
    const GammaLutBuilder builder = transfer_standard_builder(standard);
    scoped_timer timer;
    slot.lut = make_unique<GammaLutU8>(GammaLutU8::from_builder(builder));
    memory_usage_ += log_table_built(
        "8 bit encode", standard, slot.lut->table(), timer.get_time());
    validate_encode_lut(standard, *slot.lut, builder);
  });
  return *slot.lut;
}

const GammaLutU16 &StandardLuts::encode_u16(const TransferStandard standard)
{
  check_standard(standard);

  Slot<GammaLutU16> &slot = encode_u16_[standard];
  std::call_once(slot.once, [&]() {
    const GammaLutBuilder builder = transfer_standard_builder(standard);
    scoped_timer timer;
    slot.lut = make_unique<GammaLutU16>(GammaLutU16::from_builder(builder));
    memory_usage_ += log_table_built(
        "16 bit encode", standard, slot.lut->table(), timer.get_time());
    validate_encode_lut(standard, *slot.lut, builder);
  });
  return *slot.lut;
}

const Lut<float> &StandardLuts::decode_u8(const TransferStandard standard)
{
  check_standard(standard);

  Slot<Lut<float>> &slot = decode_u8_[standard];
  std::call_once(slot.once, [&]() {
    scoped_timer timer;
    slot.lut = make_unique<Lut<float>>(
        transfer_standard_builder(standard).make_u8_to_linear_lut<float>());
    memory_usage_ += log_table_built(
        "8 bit decode", standard, slot.lut->table(), timer.get_time());
  });
  return *slot.lut;
}

const Lut<float> &StandardLuts::decode_u16(const TransferStandard standard)
{
  check_standard(standard);

  Slot<Lut<float>> &slot = decode_u16_[standard];
  std::call_once(slot.once, [&]() {
    scoped_timer timer;
    slot.lut = make_unique<Lut<float>>(
        transfer_standard_builder(standard).make_u16_to_linear_lut<float>());
    memory_usage_ += log_table_built(
        "16 bit decode", standard, slot.lut->table(), timer.get_time());
  });
  return *slot.lut;
}

size_t StandardLuts::memory_usage() const
{
  return memory_usage_;
}

uint8_t linear_to_encoded_u8(const TransferStandard standard, const float linear)
{
  return StandardLuts::get().encode_u8(standard).lookup(linear);
}

uint16_t linear_to_encoded_u16(const TransferStandard standard, const float linear)
{
  return StandardLuts::get().encode_u16(standard).lookup(linear);
}

float encoded_to_linear(const TransferStandard standard, const uint8_t encoded)
{
  return StandardLuts::get().decode_u8(standard).lookup(encoded);
}

float encoded_to_linear(const TransferStandard standard, const uint16_t encoded)
{
  return StandardLuts::get().decode_u16(standard).lookup(encoded);
}

CHROMA_NAMESPACE_END
