/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <iosfwd>

#include "gamma/standards.h"

#include "util/string.h"
#include "util/types.h"
#include "util/vector.h"

CHROMA_NAMESPACE_BEGIN

struct LutCodegenOptions {
  /* Standards to write tables for, all of them when empty. */
  vector<TransferStandard> standards;

  bool encode_u8 = true;
  bool encode_u16 = true;
  /* Also write the 8 bit to float and double decode tables. */
  bool decode = false;

  /* Namespace nested in the chroma namespace, none when empty. */
  string namespace_name = "luts";
};

/* Lookup Table Code Generator
 *
 * Writes a C++ header with the tables of the standards as constants, so they
 * do not need to be built at run time. Encode tables are constructed through
 * GammaLut::from_parts, decode tables through the Lut constructor, both over
 * std::array storage. */
class LutCodegen {
 public:
  explicit LutCodegen(const LutCodegenOptions &options);

  void write(std::ostream &os) const;

  /* Standards that will be written, in order. */
  const vector<TransferStandard> &standards() const
  {
    return standards_;
  }

 private:
  void write_preamble(std::ostream &os) const;
  void write_encode_u8(std::ostream &os, const TransferStandard standard) const;
  void write_encode_u16(std::ostream &os, const TransferStandard standard) const;
  void write_decode_u8(std::ostream &os, const TransferStandard standard) const;

  LutCodegenOptions options_;
  vector<TransferStandard> standards_;
};

/* Literals that parse back to exactly the same value. */
string codegen_float_literal(const float value);
string codegen_double_literal(const double value);

CHROMA_NAMESPACE_END
