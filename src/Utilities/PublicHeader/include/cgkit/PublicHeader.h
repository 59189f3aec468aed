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

#include <cstdint>

#if !defined(CGKIT_VERSION_STRING)
#  define CGKIT_VERSION_STRING "Unknown"
#endif

constexpr const char* kLogPattern =
    "[%^%L%$ %C-%m-%d %H:%M:%S.%e %s:%#][%n] %v";

inline const char* const kDefaultCgroupRoot = "/sys/fs/cgroup";

inline const char* const kDefaultConfigPath = "/etc/cgkit/config.yaml";
inline const char* const kDefaultLogPath = "/var/log/cgkit/cgkit.log";

inline constexpr uint64_t kDefaultMaxLogFileSize = 1024 * 1024 * 50;  // 50 MB
inline constexpr uint64_t kDefaultMaxLogFileNum = 3;
