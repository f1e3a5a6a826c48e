/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

/* Chroma version number */

#define CHROMA_VERSION_MAJOR 1
#define CHROMA_VERSION_MINOR 0
#define CHROMA_VERSION_PATCH 0

#define CHROMA_MAKE_VERSION_STRING2(a, b, c) #a "." #b "." #c
#define CHROMA_MAKE_VERSION_STRING(a, b, c) CHROMA_MAKE_VERSION_STRING2(a, b, c)
#define CHROMA_VERSION_STRING \
  CHROMA_MAKE_VERSION_STRING(CHROMA_VERSION_MAJOR, CHROMA_VERSION_MINOR, CHROMA_VERSION_PATCH)

/* Layout of the encode table entries and calibration values. Generated
 * headers embed the version they were written with and refuse to compile
 * against a different one. */

#define CHROMA_LUT_FORMAT_VERSION 1
