/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "util/debug.h"

#include <cstdlib>

#include "util/log.h"

CHROMA_NAMESPACE_BEGIN

static bool env_flag(const char *name)
{
  const char *str = getenv(name);
  return str != nullptr && atoi(str) != 0;
}

DebugFlags::LUT::LUT()
{
  reset();
}

void DebugFlags::LUT::reset()
{
  validate = env_flag("CHROMA_LUT_VALIDATE");
  serial = env_flag("CHROMA_LUT_SERIAL");

  if (validate) {
    LOG_INFO << "Validating lookup tables against the exact transfer functions.";
  }
  if (serial) {
    LOG_INFO << "Building lookup tables on a single thread.";
  }
}

DebugFlags::Log::Log()
{
  reset();
}

void DebugFlags::Log::reset()
{
  level = LOG_LEVEL_UNKNOWN;

  if (const char *str = getenv("CHROMA_LOG_LEVEL")) {
    level = log_string_to_level(str);
    if (level == LOG_LEVEL_UNKNOWN) {
      LOG_WARNING << "Ignoring unknown CHROMA_LOG_LEVEL: " << str;
    }
    else {
      log_level_set(level);
    }
  }
}

DebugFlags::DebugFlags()
{
  /* Nothing for now. */
}

void DebugFlags::reset()
{
  log.reset();
  lut.reset();
}

CHROMA_NAMESPACE_END
