/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <vector>

#include "util/types.h"

CHROMA_NAMESPACE_BEGIN

/* Tables are built once and never resized, so there is no need for a memory
 * tracking allocator here, owned tables use `array` for aligned storage. */
using std::vector;

CHROMA_NAMESPACE_END
