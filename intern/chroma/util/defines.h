/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

/* clang-format off */

/* #define __forceinline triggers a bug in some clang-format versions, disable
 * format for entire file to keep results consistent. */

#pragma once

/* Qualifiers for functions defined in headers. */

/* Leave inlining decisions to compiler for these, the inline keyword here
 * is not about performance but including function definitions in headers. */
#define chroma_inline_function static inline

/* Forced inlining, used on the per pixel lookup path. */
#if defined(_WIN32) && !defined(FREE_WINDOWS)
#  define chroma_forceinline static __forceinline
#else /* _WIN32 && !FREE_WINDOWS */
#  define chroma_forceinline static inline __attribute__((always_inline))
#endif /* _WIN32 && !FREE_WINDOWS */

/* macros */

/* hints for branch prediction, only use in code that runs a _lot_ */
#if defined(__GNUC__)
#  define LIKELY(x) __builtin_expect(!!(x), 1)
#  define UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#  define LIKELY(x) (x)
#  define UNLIKELY(x) (x)
#endif
