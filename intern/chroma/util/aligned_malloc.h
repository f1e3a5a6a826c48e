/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <cstddef>

CHROMA_NAMESPACE_BEGIN

/* Alignment of owned lookup tables: one cache line, so a table entry never
 * straddles two lines. */
#define MIN_ALIGNMENT_LUT_TABLE 64  // NOLINT

/* Allocate block of size bytes at least aligned to a given value. */
void *util_aligned_malloc(const size_t size, const int alignment);

/* Free memory allocated by util_aligned_malloc. */
void util_aligned_free(void *ptr);

CHROMA_NAMESPACE_END
