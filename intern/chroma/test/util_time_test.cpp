/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "testing/testing.h"

#include "util/time.h"

CHROMA_NAMESPACE_BEGIN

TEST(time_human_readable_from_seconds, Empty)
{
  EXPECT_EQ(time_human_readable_from_seconds(0.0), "00:00.00");
}

TEST(time_human_readable_from_seconds, Fraction)
{
  EXPECT_EQ(time_human_readable_from_seconds(0.1), "00:00.10");
}

TEST(time_human_readable_from_seconds, Seconds)
{
  EXPECT_EQ(time_human_readable_from_seconds(2.1), "00:02.10");
}

TEST(time_human_readable_from_seconds, MinutesSeconds)
{
  EXPECT_EQ(time_human_readable_from_seconds(182.1), "03:02.10");
}

TEST(time_human_readable_from_seconds, HoursMinutesSeconds)
{
  EXPECT_EQ(time_human_readable_from_seconds(14582.1), "04:03:02.10");
}

TEST(scoped_timer, elapsed)
{
  double elapsed = -1.0;
  {
    scoped_timer timer(&elapsed);
    EXPECT_GE(timer.get_time(), 0.0);
    EXPECT_LE(timer.get_start(), time_dt());
  }
  EXPECT_GE(elapsed, 0.0);
}

CHROMA_NAMESPACE_END
