/* SPDX-FileCopyrightText: 2011-2022 Blender Foundation
 *
 * SPDX-License-Identifier: Apache-2.0 */

#include "util/log.h"
#include "util/string.h"
#include "util/time.h"

#include <cstdio>
#include <cstring>

CHROMA_NAMESPACE_BEGIN

LogLevel LOG_LEVEL = LOG_LEVEL_INFO_IMPORTANT;
static LogFunction LOG_FUNCTION;
static double LOG_START_TIME = time_dt();

const char *log_level_to_string(const LogLevel level)
{
  switch (level) {
    case LOG_LEVEL_FATAL:
    case LOG_LEVEL_DFATAL:
      return "FATAL";
    case LOG_LEVEL_ERROR:
      return "ERROR";
    case LOG_LEVEL_WARNING:
      return "WARNING";
    case LOG_LEVEL_INFO_IMPORTANT:
    case LOG_LEVEL_INFO:
      return "INFO";
    case LOG_LEVEL_WORK:
      return "WORK";
    case LOG_LEVEL_STATS:
      return "STATS";
    case LOG_LEVEL_DEBUG:
      return "DEBUG";
    case LOG_LEVEL_UNKNOWN:
      return "UNKNOWN";
  }

  return "";
}

LogLevel log_string_to_level(const string &str)
{
  const string str_lower = string_to_lower(str);

  if (str_lower == "fatal") {
    return LOG_LEVEL_FATAL;
  }
  if (str_lower == "error") {
    return LOG_LEVEL_ERROR;
  }
  if (str_lower == "warning") {
    return LOG_LEVEL_WARNING;
  }
  if (str_lower == "info") {
    return LOG_LEVEL_INFO;
  }
  if (str_lower == "work") {
    return LOG_LEVEL_WORK;
  }
  if (str_lower == "stats") {
    return LOG_LEVEL_STATS;
  }
  if (str_lower == "debug") {
    return LOG_LEVEL_DEBUG;
  }
  return LOG_LEVEL_UNKNOWN;
}

void log_init(const LogFunction func)
{
  LOG_FUNCTION = func;
  LOG_START_TIME = time_dt();
}

void log_level_set(const LogLevel level)
{
  LOG_LEVEL = level;
}

void log_level_set(const string &level)
{
  const LogLevel new_level = log_string_to_level(level);
  if (new_level == LOG_LEVEL_UNKNOWN) {
    LOG_ERROR << "Unknown log level specified: " << level;
    return;
  }
  LOG_LEVEL = new_level;
}

static void log_default(const LogLevel level, const string &time_str, const char *msg)
{
  if (level >= LOG_LEVEL_INFO) {
    printf("%s | %s\n", time_str.c_str(), msg);
  }
  else {
    fflush(stdout);
    fprintf(stderr, "%s | %s: %s\n", time_str.c_str(), log_level_to_string(level), msg);
  }
}

void _log_message(const LogLevel level, const char *file_line, const char *func, const char *msg)
{
  if (LOG_FUNCTION) {
    LOG_FUNCTION(level, file_line, func, msg);
  }
  else {
    const string time_str = time_human_readable_from_seconds(time_dt() - LOG_START_TIME);

    if (strchr(msg, '\n') == nullptr) {
      log_default(level, time_str, msg);
    }
    else {
      vector<string> lines;
      string_split(lines, msg, "\n", false);
      for (const string &line : lines) {
        log_default(level, time_str, line.c_str());
      }
    }
  }

  /* A custom log function does not get to turn a fatal check into a warning. */
  if (level == LOG_LEVEL_FATAL || level == LOG_LEVEL_DFATAL) {
    fflush(stdout);
    fflush(stderr);
    abort();
  }
}

CHROMA_NAMESPACE_END
