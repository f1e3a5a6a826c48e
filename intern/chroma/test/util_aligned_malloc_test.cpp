/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "testing/testing.h"

#include "util/aligned_malloc.h"
#include "util/array.h"

#define CHECK_ALIGNMENT(ptr, align) EXPECT_EQ((size_t)ptr % align, 0)

CHROMA_NAMESPACE_BEGIN

TEST(util_aligned_malloc, aligned_malloc_16)
{
  int *mem = (int *)util_aligned_malloc(sizeof(int), 16);
  CHECK_ALIGNMENT(mem, 16);
  util_aligned_free(mem);
}

/* On Apple we currently only support 16 bytes alignment. */
#ifndef __APPLE__
TEST(util_aligned_malloc, aligned_malloc_table)
{
  uint64_t *mem = (uint64_t *)util_aligned_malloc(sizeof(uint64_t) * 1152,
                                                  MIN_ALIGNMENT_LUT_TABLE);
  CHECK_ALIGNMENT(mem, MIN_ALIGNMENT_LUT_TABLE);
  util_aligned_free(mem);
}

TEST(util_array, data_alignment)
{
  const array<uint32_t> table(104);
  EXPECT_EQ(table.size(), 104u);
  CHECK_ALIGNMENT(table.data(), MIN_ALIGNMENT_LUT_TABLE);
}
#endif /* __APPLE__ */

TEST(util_array, copy_and_move)
{
  array<uint32_t> a(vector<uint32_t>{1, 2, 3});
  array<uint32_t> b(a);
  EXPECT_EQ(a, b);
  EXPECT_NE(a.data(), b.data());

  const uint32_t *data = a.data();
  array<uint32_t> c(std::move(a));
  EXPECT_EQ(c.data(), data);
  EXPECT_EQ(c[2], 3u);
  EXPECT_TRUE(a.empty());

  c.clear();
  EXPECT_TRUE(c.empty());
  EXPECT_NE(b, c);
}

CHROMA_NAMESPACE_END
