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

#include <sys/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "cgkit/Logger.h"

namespace cgkit {

enum class SubsystemKind : uint8_t {
  CPU = 0,
  CPUSET,
  CPUACCT,
  MEMORY,
  HUGETLB,
  DEVICES,
  BLKIO,
  RDMA,
  NET_CLS,
  NET_PRIO,
  PIDS,
  FREEZER,
  PERF_EVENT,

  SUBSYSTEM_COUNT,
};

inline constexpr size_t kSubsystemCount =
    static_cast<size_t>(SubsystemKind::SUBSYSTEM_COUNT);

namespace CgConstant {

// Files present in every cgroup v1 directory.
inline constexpr std::string_view kTasksFile = "tasks";
inline constexpr std::string_view kProcsFile = "cgroup.procs";
inline constexpr std::string_view kNotifyOnReleaseFile = "notify_on_release";
inline constexpr std::string_view kCloneChildrenFile = "cgroup.clone_children";
// Only in the root directory of a hierarchy.
inline constexpr std::string_view kReleaseAgentFile = "release_agent";

namespace Internal {

constexpr std::array<std::string_view, kSubsystemCount> kSubsystemStringView{
    "cpu",     "cpuset",  "cpuacct", "memory", "hugetlb",
    "devices", "blkio",   "rdma",    "net_cls", "net_prio",
    "pids",    "freezer", "perf_event",
};

constexpr std::array<SubsystemKind, kSubsystemCount> kAllSubsystems{
    SubsystemKind::CPU,      SubsystemKind::CPUSET,  SubsystemKind::CPUACCT,
    SubsystemKind::MEMORY,   SubsystemKind::HUGETLB, SubsystemKind::DEVICES,
    SubsystemKind::BLKIO,    SubsystemKind::RDMA,    SubsystemKind::NET_CLS,
    SubsystemKind::NET_PRIO, SubsystemKind::PIDS,    SubsystemKind::FREEZER,
    SubsystemKind::PERF_EVENT,
};

}  // namespace Internal

constexpr std::string_view GetSubsystemStringView(SubsystemKind kind) {
  return Internal::kSubsystemStringView[static_cast<size_t>(kind)];
}

constexpr const std::array<SubsystemKind, kSubsystemCount>& AllSubsystems() {
  return Internal::kAllSubsystems;
}

constexpr std::optional<SubsystemKind> ParseSubsystemKind(
    std::string_view name) {
  for (size_t i = 0; i < kSubsystemCount; ++i)
    if (Internal::kSubsystemStringView[i] == name)
      return static_cast<SubsystemKind>(i);
  return std::nullopt;
}

}  // namespace CgConstant

class SubsystemFlags {
 public:
  constexpr SubsystemFlags() noexcept : m_flags_(0U) {}

  constexpr explicit SubsystemFlags(SubsystemKind kind) noexcept
      : m_flags_(1U << static_cast<uint32_t>(kind)) {}

  SubsystemFlags(const SubsystemFlags &val) noexcept = default;
  SubsystemFlags &operator=(const SubsystemFlags &val) noexcept = default;

  constexpr SubsystemFlags operator|=(const SubsystemFlags &rhs) noexcept {
    m_flags_ |= rhs.m_flags_;
    return *this;
  }

  constexpr SubsystemFlags operator|=(SubsystemKind rhs) noexcept {
    m_flags_ |= 1U << static_cast<uint32_t>(rhs);
    return *this;
  }

  constexpr SubsystemFlags operator&=(const SubsystemFlags &rhs) noexcept {
    m_flags_ &= rhs.m_flags_;
    return *this;
  }

  constexpr SubsystemFlags operator~() const noexcept {
    SubsystemFlags sf;
    sf.m_flags_ = ~m_flags_ & kAllBits_;
    return sf;
  }

  constexpr bool Contains(SubsystemKind kind) const noexcept {
    return (m_flags_ & (1U << static_cast<uint32_t>(kind))) != 0;
  }

  constexpr bool Empty() const noexcept { return m_flags_ == 0; }

  constexpr bool operator==(const SubsystemFlags &rhs) const noexcept {
    return m_flags_ == rhs.m_flags_;
  }

  // Contained kinds in SubsystemKind order.
  std::vector<SubsystemKind> Kinds() const {
    std::vector<SubsystemKind> kinds;
    for (SubsystemKind kind : CgConstant::AllSubsystems())
      if (Contains(kind)) kinds.push_back(kind);
    return kinds;
  }

  // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
  operator bool() const noexcept { return m_flags_ != 0; }

 private:
  static constexpr uint32_t kAllBits_ = (1U << kSubsystemCount) - 1;

  friend constexpr SubsystemFlags operator|(const SubsystemFlags &lhs,
                                            const SubsystemFlags &rhs) noexcept;
  friend constexpr SubsystemFlags operator&(const SubsystemFlags &lhs,
                                            const SubsystemFlags &rhs) noexcept;
  friend constexpr SubsystemFlags operator|(const SubsystemFlags &lhs,
                                            SubsystemKind rhs) noexcept;
  friend constexpr SubsystemFlags operator|(SubsystemKind lhs,
                                            SubsystemKind rhs) noexcept;
  uint32_t m_flags_;
};

constexpr SubsystemFlags operator|(const SubsystemFlags &lhs,
                                   const SubsystemFlags &rhs) noexcept {
  SubsystemFlags flags;
  flags.m_flags_ = lhs.m_flags_ | rhs.m_flags_;
  return flags;
}

constexpr SubsystemFlags operator&(const SubsystemFlags &lhs,
                                   const SubsystemFlags &rhs) noexcept {
  SubsystemFlags flags;
  flags.m_flags_ = lhs.m_flags_ & rhs.m_flags_;
  return flags;
}

constexpr SubsystemFlags operator|(const SubsystemFlags &lhs,
                                   SubsystemKind rhs) noexcept {
  SubsystemFlags flags;
  flags.m_flags_ = lhs.m_flags_ | (1U << static_cast<uint32_t>(rhs));
  return flags;
}

constexpr SubsystemFlags operator|(SubsystemKind lhs,
                                   SubsystemKind rhs) noexcept {
  SubsystemFlags flags;
  flags.m_flags_ =
      (1U << static_cast<uint32_t>(lhs)) | (1U << static_cast<uint32_t>(rhs));
  return flags;
}

// NOLINTBEGIN(readability-identifier-naming)
constexpr SubsystemFlags NO_SUBSYSTEM_FLAG{};

constexpr SubsystemFlags ALL_SUBSYSTEM_FLAG = (~NO_SUBSYSTEM_FLAG);
// NOLINTEND(readability-identifier-naming)

/**
 * Process or thread id as written to `tasks` / `cgroup.procs`.
 */
class Pid {
 public:
  constexpr explicit Pid(pid_t pid) noexcept : m_pid_(pid) {}

  constexpr pid_t Raw() const noexcept { return m_pid_; }
  constexpr explicit operator pid_t() const noexcept { return m_pid_; }

  static Pid Self() noexcept;

  constexpr auto operator<=>(const Pid &) const = default;

 private:
  pid_t m_pid_;
};

}  // namespace cgkit

namespace fmt {

template <>
struct formatter<cgkit::SubsystemKind> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::SubsystemKind &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}",
                          cgkit::CgConstant::GetSubsystemStringView(v));
  }
};

template <>
struct formatter<cgkit::Pid> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::Pid &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", v.Raw());
  }
};

}  // namespace fmt
