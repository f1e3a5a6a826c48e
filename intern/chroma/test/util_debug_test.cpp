/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "testing/testing.h"

#include <cstdlib>

#include "util/debug.h"

CHROMA_NAMESPACE_BEGIN

/* Restores flags read from an unset environment. */
class util_debug : public ::testing::Test {
 protected:
  void SetUp() override
  {
    saved_level_ = LOG_LEVEL;
  }

  void TearDown() override
  {
    unsetenv("CHROMA_LUT_VALIDATE");
    unsetenv("CHROMA_LUT_SERIAL");
    unsetenv("CHROMA_LOG_LEVEL");
    DebugFlags().reset();
    log_level_set(saved_level_);
  }

  LogLevel saved_level_ = LOG_LEVEL_INFO_IMPORTANT;
};

TEST_F(util_debug, defaults)
{
  unsetenv("CHROMA_LUT_VALIDATE");
  unsetenv("CHROMA_LUT_SERIAL");
  unsetenv("CHROMA_LOG_LEVEL");
  DebugFlags().reset();

  EXPECT_FALSE(DebugFlags().lut.validate);
  EXPECT_FALSE(DebugFlags().lut.serial);
  EXPECT_EQ(DebugFlags().log.level, LOG_LEVEL_UNKNOWN);
}

TEST_F(util_debug, lut_flags)
{
  setenv("CHROMA_LUT_VALIDATE", "1", 1);
  setenv("CHROMA_LUT_SERIAL", "0", 1);
  DebugFlags().lut.reset();

  EXPECT_TRUE(DebugFlags().lut.validate);
  EXPECT_FALSE(DebugFlags().lut.serial);

  setenv("CHROMA_LUT_SERIAL", "2", 1);
  DebugFlags().lut.reset();
  EXPECT_TRUE(DebugFlags().lut.serial);
}

TEST_F(util_debug, log_level)
{
  setenv("CHROMA_LOG_LEVEL", "work", 1);
  DebugFlags().log.reset();

  EXPECT_EQ(DebugFlags().log.level, LOG_LEVEL_WORK);
  EXPECT_EQ(LOG_LEVEL, LOG_LEVEL_WORK);
}

TEST_F(util_debug, unknown_log_level)
{
  log_level_set(LOG_LEVEL_ERROR);
  setenv("CHROMA_LOG_LEVEL", "loud", 1);
  DebugFlags().log.reset();

  EXPECT_EQ(DebugFlags().log.level, LOG_LEVEL_UNKNOWN);
  EXPECT_EQ(LOG_LEVEL, LOG_LEVEL_ERROR);
}

CHROMA_NAMESPACE_END
