/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

/* Argument Parsing for command line, we use the OpenImageIO
 * library because it has nice functions to do this. */

#include <OpenImageIO/argparse.h>

CHROMA_NAMESPACE_BEGIN

using OIIO::ArgParse;

CHROMA_NAMESPACE_END
