/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "util/aligned_malloc.h"

#if !defined(__APPLE__) && !defined(__FreeBSD__) && !defined(__NetBSD__) && !defined(__OpenBSD__)
/* Needed for memalign on Linux and _aligned_alloc on Windows. */
#  include <malloc.h>
#else
/* Apple's `malloc` is 16-byte aligned, and does not have `malloc.h`, so include
 * `stdilb` instead.
 */
#  include <cstdlib>
#endif

CHROMA_NAMESPACE_BEGIN

void *util_aligned_malloc(const size_t size, const int alignment)
{
  void *mem = nullptr;
#if defined(_WIN32)
  mem = _aligned_malloc(size, alignment);
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
  if (posix_memalign(&mem, alignment, size)) {
    /* Non-zero means allocation error
     * either no allocation or bad alignment value. */
    mem = nullptr;
  }
#else /* This is for Linux. */
  mem = memalign(alignment, size);
#endif
  return mem;
}

void util_aligned_free(void *ptr)
{
#if defined(_WIN32)
  _aligned_free(ptr);
#else
  free(ptr);
#endif
}

CHROMA_NAMESPACE_END
