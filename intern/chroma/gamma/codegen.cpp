/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "gamma/codegen.h"
#include "gamma/lut_builder.h"
#include "gamma/lut_output.h"

#include <ostream>

#include "util/log.h"
#include "util/string.h"
#include "util/version.h"

CHROMA_NAMESPACE_BEGIN

/* Number of table values per line of generated code. */
#define CODEGEN_U32_PER_LINE 6
#define CODEGEN_U64_PER_LINE 4
#define CODEGEN_FLOAT_PER_LINE 4

static string number_literal(string str)
{
  /* Integral values print without a decimal point. */
  if (str.find_first_of(".e") == string::npos) {
    str += ".0";
  }
  return str;
}

string codegen_float_literal(const float value)
{
  return number_literal(string_printf("%.9g", double(value))) + "f";
}

string codegen_double_literal(const double value)
{
  return number_literal(string_printf("%.17g", value));
}

template<typename T, typename Format>
static void write_values(std::ostream &os,
                         const T *values,
                         const size_t num,
                         const int per_line,
                         const Format &format)
{
  for (size_t i = 0; i < num; i++) {
    os << ((i % per_line == 0) ? "         " : " ") << format(values[i]);
    if (i + 1 < num) {
      os << ",";
    }
    if ((i + 1) % per_line == 0 || i + 1 == num) {
      os << "\n";
    }
  }
}

LutCodegen::LutCodegen(const LutCodegenOptions &options) : options_(options)
{
  if (options_.standards.empty()) {
    for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
      standards_.push_back(TransferStandard(i));
    }
  }
  else {
    standards_ = options_.standards;
  }
}

void LutCodegen::write_preamble(std::ostream &os) const
{
  os << "/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation\n"
     << " *\n"
     << " * SPDX-License-Identifier: Apache-2.0 */\n"
     << "\n"
     << "/* Generated by chroma_lut_codegen " << CHROMA_VERSION_STRING << ", do not edit. */\n"
     << "\n"
     << "#pragma once\n"
     << "\n"
     << "#include <array>\n"
     << "\n"
     << "#include \"gamma/lut.h\"\n"
     << "#include \"gamma/table.h\"\n"
     << "\n"
     << "#include \"util/version.h\"\n"
     << "\n"
     << "#if CHROMA_LUT_FORMAT_VERSION != " << CHROMA_LUT_FORMAT_VERSION << "\n"
     << "#  error \"Tables were generated for a different table format, regenerate them.\"\n"
     << "#endif\n"
     << "\n";
}

void LutCodegen::write_encode_u8(std::ostream &os, const TransferStandard standard) const
{
  const GammaLutBuilder builder = transfer_standard_builder(standard);
  const array<uint32_t> table = builder.linear_to_u8_entries();
  const string type = string_printf("GammaLut<uint8_t, std::array<uint32_t, %zu>>",
                                    table.size());

  os << "/* " << builder.transfer_function() << " */\n"
     << "inline constexpr " << type << " " << transfer_standard_identifier(standard)
     << "_F32_TO_U8 =\n"
     << "    " << type << "::from_parts(\n"
     << "        " << string_printf("0x%08xu", builder.linear_to_u8_min_float_bits()) << ",\n"
     << "        " << codegen_float_literal(builder.linear_to_u8_linear_slope()) << ",\n"
     << "        {{\n";
  write_values(os, table.data(), table.size(), CODEGEN_U32_PER_LINE, [](const uint32_t v) {
    return string_printf("0x%08xu", v);
  });
  os << "        }});\n\n";

  LOG_INFO << "Wrote " << transfer_standard_name(standard) << " 8 bit encode table, "
           << table.size() << " entries";
}

void LutCodegen::write_encode_u16(std::ostream &os, const TransferStandard standard) const
{
  const GammaLutBuilder builder = transfer_standard_builder(standard);
  const array<uint64_t> table = builder.linear_to_u16_entries();
  const string type = string_printf("GammaLut<uint16_t, std::array<uint64_t, %zu>>",
                                    table.size());

  os << "/* " << builder.transfer_function() << " */\n"
     << "inline constexpr " << type << " " << transfer_standard_identifier(standard)
     << "_F32_TO_U16 =\n"
     << "    " << type << "::from_parts(\n"
     << "        " << string_printf("0x%08xu", builder.linear_to_u16_min_float_bits()) << ",\n"
     << "        " << codegen_float_literal(builder.linear_to_u16_linear_slope()) << ",\n"
     << "        {{\n";
  write_values(os, table.data(), table.size(), CODEGEN_U64_PER_LINE, [](const uint64_t v) {
    return string_printf("0x%016llxull", (unsigned long long)v);
  });
  os << "        }});\n\n";

  LOG_INFO << "Wrote " << transfer_standard_name(standard) << " 16 bit encode table, "
           << table.size() << " entries";
}

void LutCodegen::write_decode_u8(std::ostream &os, const TransferStandard standard) const
{
  const GammaLutBuilder builder = transfer_standard_builder(standard);
  const vector<double> entries = builder.u8_to_linear_entries();
  const string identifier = transfer_standard_identifier(standard);

  os << "inline constexpr Lut<float, std::array<float, 256>> " << identifier
     << "_U8_TO_F32{std::array<float, 256>{{\n";
  write_values(os, entries.data(), entries.size(), CODEGEN_FLOAT_PER_LINE, [](const double v) {
    return codegen_float_literal(float(v));
  });
  os << "}}};\n\n";

  os << "inline constexpr Lut<double, std::array<double, 256>> " << identifier
     << "_U8_TO_F64{std::array<double, 256>{{\n";
  write_values(os, entries.data(), entries.size(), CODEGEN_FLOAT_PER_LINE, [](const double v) {
    return codegen_double_literal(v);
  });
  os << "}}};\n\n";

  LOG_INFO << "Wrote " << transfer_standard_name(standard) << " 8 bit decode tables";
}

void LutCodegen::write(std::ostream &os) const
{
  write_preamble(os);

  os << "CHROMA_NAMESPACE_BEGIN\n\n";
  if (!options_.namespace_name.empty()) {
    os << "namespace " << options_.namespace_name << " {\n\n";
  }

  for (const TransferStandard standard : standards_) {
    if (options_.encode_u8) {
      if (transfer_standard_has_u8_encode(standard)) {
        write_encode_u8(os, standard);
      }
      else {
        LOG_WARNING << "Skipping 8 bit encode table for " << transfer_standard_name(standard)
                    << ", it can not encode 0 exactly";
      }
    }
    if (options_.encode_u16) {
      write_encode_u16(os, standard);
    }
    if (options_.decode) {
      write_decode_u8(os, standard);
    }
  }

  if (!options_.namespace_name.empty()) {
    os << "}  // namespace " << options_.namespace_name << "\n\n";
  }
  os << "CHROMA_NAMESPACE_END\n";
}

CHROMA_NAMESPACE_END
