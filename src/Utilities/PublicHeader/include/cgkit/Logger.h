/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

// For better logging inside lambda functions
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
#  define __FUNCTION__ __PRETTY_FUNCTION__
#endif

#include "PublicHeader.h"

#define CGKIT_LOG_LEVEL_TRACE 0
#define CGKIT_LOG_LEVEL_DEBUG 1
#define CGKIT_LOG_LEVEL_INFO 2
#define CGKIT_LOG_LEVEL_WARN 3
#define CGKIT_LOG_LEVEL_ERROR 4
#define CGKIT_LOG_LEVEL_CRITICAL 5
#define CGKIT_LOG_LEVEL_OFF 6

#if !defined(CGKIT_LOG_LEVEL)
#  if defined(NDEBUG)
#    define CGKIT_LOG_LEVEL CGKIT_LOG_LEVEL_INFO
#  else
#    define CGKIT_LOG_LEVEL CGKIT_LOG_LEVEL_TRACE
#  endif
#endif

#define SPDLOG_ACTIVE_LEVEL CGKIT_LOG_LEVEL

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Must be after the static log level definition
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#define CGKIT_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define CGKIT_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define CGKIT_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define CGKIT_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define CGKIT_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define CGKIT_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#ifndef NDEBUG
#  define CGKIT_ASSERT_MSG(condition, message)                             \
    do {                                                                   \
      if (!(condition)) {                                                  \
        CGKIT_CRITICAL("Assertion failed: \"" #condition "\": " #message); \
        std::terminate();                                                  \
      }                                                                    \
    } while (false)

#  define CGKIT_ASSERT(condition)                               \
    do {                                                        \
      if (!(condition)) {                                       \
        CGKIT_CRITICAL("Assertion failed: \"" #condition "\""); \
        std::terminate();                                       \
      }                                                         \
    } while (false)
#else
#  define CGKIT_ASSERT_MSG(condition, message) \
    do {                                       \
    } while (false)

#  define CGKIT_ASSERT(condition) \
    do {                          \
    } while (false)
#endif

struct LoggerSinks {
  std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
};

std::optional<spdlog::level::level_enum> StrToLogLevel(
    const std::string& level);

/**
 * Install the default async logger. The library itself never calls this;
 * hosts that do not call it get spdlog's default stdout logger.
 */
void InitLogger(spdlog::level::level_enum level,
                const std::filesystem::path& log_file_path,
                bool enable_console,
                uint64_t max_file_size = kDefaultMaxLogFileSize,
                uint64_t max_file_num = kDefaultMaxLogFileNum);

// Console only, used by tests and tools that have no log directory.
void InitConsoleLogger(spdlog::level::level_enum level);
