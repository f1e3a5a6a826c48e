/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#pragma once

#include <string>

#include "util/vector.h"

CHROMA_NAMESPACE_BEGIN

using std::string;
using std::to_string;

#ifdef __GNUC__
#  define PRINTF_ATTRIBUTE __attribute__((format(printf, 1, 2)))
#else
#  define PRINTF_ATTRIBUTE
#endif

string string_printf(const char *format, ...) PRINTF_ATTRIBUTE;

bool string_iequals(const string &a, const string &b);
void string_split(vector<string> &tokens,
                  const string &str,
                  const string &separators = "\t ",
                  bool skip_empty_tokens = true);
string string_to_lower(const string &s);
string string_to_upper(const string &s);

/* Make a string from a size in bytes in human readable form. */
string string_human_readable_size(size_t size);
/* Make a string from a unit-less quantity in human readable form. */
string string_human_readable_number(size_t num);

CHROMA_NAMESPACE_END
