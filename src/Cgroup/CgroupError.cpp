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

#include "cgkit/CgroupError.h"

#include <absl/strings/str_join.h>

#include <cstring>

namespace cgkit {

std::string CgError::ToString() const {
  std::string s = fmt::format("{}: {}", CgErrStr(code), description);

  if (sys_errno != 0)
    s += fmt::format(" (errno {}: {})", sys_errno, std::strerror(sys_errno));

  if (!committed.empty())
    s += fmt::format(" [committed: {}]", absl::StrJoin(committed, ", "));

  if (!failures.empty()) {
    std::vector<std::string> parts;
    parts.reserve(failures.size());
    for (const auto &f : failures)
      parts.emplace_back(fmt::format("{}: {}", f.kind, f.error.ToString()));
    s += fmt::format(" {{{}}}", absl::StrJoin(parts, "; "));
  }

  return s;
}

CgError MakeIoErr(int sys_errno, const std::filesystem::path &file,
                  std::string_view action) {
  CgError err = FormatCgErr(CgErrCode::IO, "Failed to {} {}: {}", action,
                            file.string(), std::strerror(sys_errno));
  err.sys_errno = sys_errno;
  err.file = file.string();
  return err;
}

CgError MakeParseErr(const std::filesystem::path &file,
                     std::string_view content) {
  constexpr size_t kMaxShown = 64;
  std::string_view shown = content.substr(0, kMaxShown);

  CgError err = FormatCgErr(CgErrCode::PARSE, "Cannot parse {}: \"{}\"{}",
                            file.string(), shown,
                            content.size() > kMaxShown ? "..." : "");
  err.file = file.string();
  return err;
}

}  // namespace cgkit
