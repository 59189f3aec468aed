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
#include <string>
#include <string_view>

#include "cgkit/CgroupError.h"
#include "cgkit/CgroupPublicDefs.h"

namespace cgkit {

/**
 * A subsystem kind plus a directory path relative to that subsystem's mount
 * root. The relative part never starts with '/' and never contains ".."
 * segments. Both "" and "/" name the hierarchy root.
 *
 * No I/O happens here. The absolute path is produced by Hierarchies.
 */
class CgroupPath {
 public:
  // For trusted input. ".." segments are a programmer error: they trip
  // CGKIT_ASSERT in debug builds and are dropped otherwise.
  CgroupPath(SubsystemKind kind, std::string_view relative);

  // For untrusted input.
  static CgExpected<CgroupPath> Make(SubsystemKind kind,
                                     std::string_view relative);

  SubsystemKind Kind() const { return m_kind_; }
  const std::string &Relative() const { return m_relative_; }
  bool IsRoot() const { return m_relative_.empty(); }

  CgExpected<CgroupPath> Join(std::string_view child) const;

  // The root's parent is the root.
  CgroupPath Parent() const;

  CgroupPath WithKind(SubsystemKind kind) const;

  bool operator==(const CgroupPath &rhs) const = default;

 private:
  CgroupPath() = default;

  SubsystemKind m_kind_{SubsystemKind::CPU};
  std::string m_relative_;
};

}  // namespace cgkit

namespace fmt {

template <>
struct formatter<cgkit::CgroupPath> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::CgroupPath &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}:/{}", v.Kind(), v.Relative());
  }
};

}  // namespace fmt
