/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include "util/log.h"

CHROMA_NAMESPACE_BEGIN

/* Global storage for all sort of flags used to fine-tune behavior of particular
 * areas for the development purposes, without officially exposing settings to
 * the interface. All of them are read from the environment.
 */
class DebugFlags {
 public:
  /* Lookup table construction. */
  struct LUT {
    LUT();

    /* Reset flags to their defaults. */
    void reset();

    /* Compare every table built by the standards registry against the exact
     * transfer function, CHROMA_LUT_VALIDATE. */
    bool validate = false;

    /* Fit buckets on the calling thread instead of the TBB workers,
     * CHROMA_LUT_SERIAL. */
    bool serial = false;
  };

  /* Logging. */
  struct Log {
    Log();

    /* Reset flags to their defaults and apply them. */
    void reset();

    /* Level requested by CHROMA_LOG_LEVEL, LOG_LEVEL_UNKNOWN when unset or
     * not a valid level name. */
    LogLevel level = LOG_LEVEL_UNKNOWN;
  };

  /* Get instance of debug flags registry. */
  static DebugFlags &get()
  {
    static DebugFlags instance;
    return instance;
  }

  /* Reset flags to their defaults. */
  void reset();

  /* Requested logging flags, first so the level applies to the rest. */
  Log log;

  /* Requested lookup table flags. */
  LUT lut;

 private:
  DebugFlags();

 public:
  explicit DebugFlags(DebugFlags const & /*other*/) = delete;
  void operator=(DebugFlags const & /*other*/) = delete;
};

inline DebugFlags &DebugFlags()
{
  return DebugFlags::get();
}

CHROMA_NAMESPACE_END
