/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

using tbb::blocked_range;
using tbb::parallel_for;

/* Run func(begin, end) over [0, num) either on the TBB workers or on the
 * calling thread. Calls may run concurrently for disjoint ranges. */
template<typename Func>
static inline void parallel_for_range(const size_t num, const bool serial, const Func &func)
{
  if (serial) {
    func(size_t(0), num);
    return;
  }
  parallel_for(blocked_range<size_t>(0, num),
               [&](const blocked_range<size_t> &r) { func(r.begin(), r.end()); });
}

CHROMA_NAMESPACE_END
