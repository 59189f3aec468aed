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

#include "cgkit/CgroupPath.h"

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include <optional>
#include <vector>

namespace cgkit {

namespace {

// Collapses "//" and "." and strips leading and trailing '/'. Returns
// std::nullopt when a ".." segment is present.
std::optional<std::string> NormalizeRelative(std::string_view relative,
                                             bool drop_dotdot) {
  std::vector<std::string_view> segments;
  for (std::string_view seg :
       absl::StrSplit(relative, '/', absl::SkipEmpty())) {
    if (seg == ".") continue;
    if (seg == "..") {
      if (!drop_dotdot) return std::nullopt;
      continue;
    }
    segments.emplace_back(seg);
  }
  return absl::StrJoin(segments, "/");
}

}  // namespace

CgroupPath::CgroupPath(SubsystemKind kind, std::string_view relative)
    : m_kind_(kind) {
  CGKIT_ASSERT_MSG(NormalizeRelative(relative, false).has_value(),
                   "cgroup path must not contain '..'");
  m_relative_ = NormalizeRelative(relative, true).value();
}

CgExpected<CgroupPath> CgroupPath::Make(SubsystemKind kind,
                                        std::string_view relative) {
  auto normalized = NormalizeRelative(relative, false);
  if (!normalized) {
    CGKIT_WARN("Rejected cgroup path '{}' for {}: contains '..'", relative,
               kind);
    CgError err = FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                              "Cgroup path '{}' contains '..'", relative);
    err.file = std::string(relative);
    return std::unexpected(std::move(err));
  }

  CgroupPath path;
  path.m_kind_ = kind;
  path.m_relative_ = std::move(normalized).value();
  return path;
}

CgExpected<CgroupPath> CgroupPath::Join(std::string_view child) const {
  if (m_relative_.empty()) return Make(m_kind_, child);
  return Make(m_kind_, fmt::format("{}/{}", m_relative_, child));
}

CgroupPath CgroupPath::Parent() const {
  CgroupPath parent = *this;
  auto pos = parent.m_relative_.rfind('/');
  if (pos == std::string::npos)
    parent.m_relative_.clear();
  else
    parent.m_relative_.resize(pos);
  return parent;
}

CgroupPath CgroupPath::WithKind(SubsystemKind kind) const {
  CgroupPath path = *this;
  path.m_kind_ = kind;
  return path;
}

}  // namespace cgkit
