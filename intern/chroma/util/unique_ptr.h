/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <memory>

CHROMA_NAMESPACE_BEGIN

using std::make_unique;
using std::unique_ptr;

CHROMA_NAMESPACE_END
