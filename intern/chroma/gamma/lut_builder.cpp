/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "gamma/lut_builder.h"
#include "gamma/linear_model.h"
#include "gamma/lut_output.h"

#include "util/debug.h"
#include "util/log.h"
#include "util/math.h"
#include "util/tbb.h"
#include "util/time.h"

CHROMA_NAMESPACE_BEGIN

template<typename E>
static array<typename GammaLutOutput<E>::TableValue> build_encode_entries(
    const TransferFunction &fn, const uint32_t min_float_bits)
{
  using Output = GammaLutOutput<E>;
  using TableValue = typename Output::TableValue;

  /* Number of mantissa bits below the table index. */
  const uint32_t bucket_index_width = GAMMA_LUT_MANTISSA_BITS - Output::MAN_INDEX_WIDTH;
  const uint32_t bucket_size = 1u << bucket_index_width;

  const size_t table_size = gamma_lut_table_size<E>(min_float_bits);
  array<TableValue> table(table_size);

  const bool serial = DebugFlags().lut.serial;
  scoped_timer timer;

  /* Buckets are independent, every task writes its own entries. */
  parallel_for_range(table_size, serial, [&](const size_t begin, const size_t end) {
    for (size_t i = begin; i < end; i++) {
      const uint32_t start_bits = min_float_bits + (uint32_t(i) << bucket_index_width);
      const uint32_t end_bits = start_bits + bucket_size;
      const LinearModel model(
          fn, start_bits, end_bits, Output::MAN_INDEX_WIDTH, Output::BITS);
      table[i] = Output::pack(model);
    }
  });

  LOG_WORK << "Fitted " << table_size << " buckets for " << Output::BITS << " bit " << fn
           << " in " << time_human_readable_from_seconds(timer.get_time())
           << (serial ? " (serial)" : "");

  return table;
}

vector<double> GammaLutBuilder::u8_to_linear_entries() const
{
  vector<double> entries(256);
  for (size_t encoded = 0; encoded < entries.size(); encoded++) {
    entries[encoded] = transfer_function_.evaluate(double(encoded) / 255.0);
  }
  return entries;
}

vector<double> GammaLutBuilder::u16_to_linear_entries() const
{
  vector<double> entries(65536);
  for (size_t encoded = 0; encoded < entries.size(); encoded++) {
    entries[encoded] = transfer_function_.evaluate(double(encoded) / 65535.0);
  }
  return entries;
}

array<uint32_t> GammaLutBuilder::linear_to_u8_entries() const
{
  return build_encode_entries<uint8_t>(transfer_function_, linear_to_u8_min_float_bits());
}

uint32_t GammaLutBuilder::linear_to_u8_min_float_bits() const
{
  const float half_step = float(transfer_function_.evaluate(0.5 / 255.0));
  return (__float_as_uint(half_step) - 1) & 0xff800000u;
}

float GammaLutBuilder::linear_to_u8_linear_slope() const
{
  return 255.0f * float(transfer_function_.linear_slope());
}

array<uint64_t> GammaLutBuilder::linear_to_u16_entries() const
{
  return build_encode_entries<uint16_t>(transfer_function_, linear_to_u16_min_float_bits());
}

uint32_t GammaLutBuilder::linear_to_u16_min_float_bits() const
{
  const uint32_t beta_bits = __float_as_uint(float(transfer_function_.beta()));
  const float half_step = float(transfer_function_.evaluate(0.5 / 65535.0));
  return max(beta_bits, __float_as_uint(half_step) - 1) & 0xff800000u;
}

float GammaLutBuilder::linear_to_u16_linear_slope() const
{
  return 65535.0f * float(transfer_function_.linear_slope());
}

CHROMA_NAMESPACE_END
