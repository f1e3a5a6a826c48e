/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <cstdlib>

/* Standard Integer Types */

#include <cstddef>  // IWYU pragma: export
#include <cstdint>  // IWYU pragma: export
#include <cstdio>

#include "util/defines.h"

CHROMA_NAMESPACE_BEGIN

/* Types
 *
 * Define simpler unsigned type names. Table entries and bit patterns always
 * use the fixed width types so their size never depends on the platform. */

/* Shorter Unsigned Names */

using uint = unsigned int;

CHROMA_NAMESPACE_END
