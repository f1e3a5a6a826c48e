/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "gamma/codegen.h"
#include "gamma/standards.h"

#include "util/args.h"
#include "util/debug.h"
#include "util/log.h"
#include "util/string.h"
#include "util/time.h"
#include "util/version.h"

CHROMA_NAMESPACE_BEGIN

struct Options {
  LutCodegenOptions codegen;
  string output_filepath;
} options;

static void parse_string(OIIO::cspan<const char *> argv, std::string *s)
{
  assert(argv.size() == 2);
  *s = argv[1];
}

static string standard_names()
{
  string names;
  for (int i = 0; i < TRANSFER_STANDARD_NUM; i++) {
    if (!names.empty()) {
      names += ", ";
    }
    names += transfer_standard_name(TransferStandard(i));
  }
  return names;
}

static void options_parse(const int argc, const char **argv)
{
  vector<string> standards;
  string bits = "all";

  /* parse options */
  ArgParse ap;
  bool help = false;
  bool version = false;
  string log_level;

  ap.usage("chroma_lut_codegen [options]");
  ap.arg("--standard %s:STANDARD")
      .help("Transfer function to write tables for, can be repeated: " + standard_names() +
            " (default all)")
      .action([&](auto argv) {
        string name;
        parse_string(argv, &name);
        standards.push_back(name);
      });
  ap.arg("--bits %s:BITS")
      .help("Encoded width of the encode tables: 8, 16 or all")
      .action([&](auto argv) { parse_string(argv, &bits); });
  ap.arg("--decode", &options.codegen.decode).help("Also write 8 bit decode tables");
  ap.arg("--output %s:OUTPUT").help("File path to write the header to, default stdout").action(
      [&](auto argv) { parse_string(argv, &options.output_filepath); });
  ap.arg("--namespace %s:NAMESPACE")
      .help("Namespace of the tables inside the chroma namespace, empty for none")
      .action([&](auto argv) { parse_string(argv, &options.codegen.namespace_name); });
  ap.arg("--log-level %s:LEVEL")
      .help("Log verbosity: fatal, error, warning, info, work, stats, debug")
      .action([&](auto argv) { parse_string(argv, &log_level); });
  ap.arg("--help", &help).help("Print help message");
  ap.arg("--version", &version).help("Print version number");

  if (ap.parse_args(argc, argv) < 0) {
    fprintf(stderr, "%s\n", ap.geterror().c_str());
    ap.print_help();
    exit(EXIT_FAILURE);
  }

  if (!log_level.empty()) {
    log_level_set(log_level);
  }

  if (version) {
    printf("%s\n", CHROMA_VERSION_STRING);
    exit(EXIT_SUCCESS);
  }
  else if (help) {
    ap.print_help();
    exit(EXIT_SUCCESS);
  }

  for (const string &name : standards) {
    const TransferStandard standard = transfer_standard_from_string(name);
    if (standard == TRANSFER_STANDARD_NUM) {
      fprintf(stderr, "Unknown standard: %s\n", name.c_str());
      ap.print_help();
      exit(EXIT_FAILURE);
    }
    options.codegen.standards.push_back(standard);
  }

  if (bits == "8") {
    options.codegen.encode_u16 = false;
  }
  else if (bits == "16") {
    options.codegen.encode_u8 = false;
  }
  else if (bits != "all") {
    fprintf(stderr, "Unknown encoded width: %s\n", bits.c_str());
    ap.print_help();
    exit(EXIT_FAILURE);
  }
}

/* The header may go to stdout, keep all log output on stderr. */
static void log_to_stderr(const LogLevel level,
                          const char * /*file_line*/,
                          const char * /*func*/,
                          const char *msg)
{
  fprintf(stderr, "%s: %s\n", log_level_to_string(level), msg);
}

static bool write_header(std::ostream &os)
{
  const LutCodegen codegen(options.codegen);
  codegen.write(os);
  os.flush();
  return bool(os);
}

CHROMA_NAMESPACE_END

using namespace chroma;

int main(const int argc, const char **argv)
{
  log_init(log_to_stderr);
  /* Apply CHROMA_LOG_LEVEL and friends before the command line overrides them. */
  DebugFlags();
  options_parse(argc, argv);

  scoped_timer timer;

  if (options.output_filepath.empty()) {
    if (!write_header(std::cout)) {
      LOG_ERROR << "Failed to write tables to stdout";
      return EXIT_FAILURE;
    }
  }
  else {
    std::ofstream file(options.output_filepath);
    if (!file) {
      LOG_ERROR << "Failed to open " << options.output_filepath << " for writing";
      return EXIT_FAILURE;
    }
    if (!write_header(file)) {
      LOG_ERROR << "Failed to write tables to " << options.output_filepath;
      return EXIT_FAILURE;
    }
  }

  LOG_INFO_IMPORTANT << "Tables written in "
                     << time_human_readable_from_seconds(timer.get_time());

  return EXIT_SUCCESS;
}
