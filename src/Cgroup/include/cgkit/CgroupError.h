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

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cgkit/CgroupPublicDefs.h"

namespace cgkit {

enum class CgErrCode : uint8_t {
  NOT_MOUNTED = 0,
  IO,
  PARSE,
  INVALID_ARGUMENT,
  INVALID_OPERATION,
  PARTIAL_FAILURE,

  ERR_CODE_COUNT,
};

struct CgSubsystemFailure;

struct CgError {
  CgErrCode code{CgErrCode::IO};
  std::string description;

  // errno of the failing syscall, 0 unless code is IO.
  int sys_errno{0};

  // Control file or directory the error is about. May be empty.
  std::string file;

  // Files already written by the Apply() call that failed.
  std::vector<std::string> committed;

  // Per subsystem errors of a PARTIAL_FAILURE, in SubsystemKind order.
  std::vector<CgSubsystemFailure> failures;

  std::string ToString() const;
};

struct CgSubsystemFailure {
  SubsystemKind kind;
  CgError error;
};

template <typename T>
using CgExpected = std::expected<T, CgError>;

namespace Internal {

// clang-format off
constexpr std::array<std::string_view,
                     static_cast<size_t>(CgErrCode::ERR_CODE_COUNT)>
    kCgErrStrArr = {
        "Subsystem is not mounted",
        "I/O error on the cgroup filesystem",
        "Malformed control file content",
        "Invalid argument",
        "Operation not valid on this cgroup",
        "One or more subsystems failed",
    };
// clang-format on

}  // namespace Internal

constexpr std::string_view CgErrStr(CgErrCode code) {
  return Internal::kCgErrStrArr[static_cast<size_t>(code)];
}

template <typename... Args>
inline CgError FormatCgErr(CgErrCode code, fmt::format_string<Args...> fmt,
                           Args &&...args) {
  CgError err;
  err.code = code;
  err.description = fmt::format(fmt, std::forward<Args>(args)...);
  return err;
}

// IO error for a failed syscall on `file`. Description includes strerror.
CgError MakeIoErr(int sys_errno, const std::filesystem::path &file,
                  std::string_view action);

CgError MakeParseErr(const std::filesystem::path &file,
                     std::string_view content);

}  // namespace cgkit

namespace fmt {

template <>
struct formatter<cgkit::CgErrCode> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::CgErrCode &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", cgkit::CgErrStr(v));
  }
};

template <>
struct formatter<cgkit::CgError> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::CgError &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", v.ToString());
  }
};

}  // namespace fmt
