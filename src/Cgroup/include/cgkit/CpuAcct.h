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

#include "cgkit/Subsystem.h"

namespace cgkit {

// In USER_HZ.
struct CpuAcctStat {
  uint64_t user;
  uint64_t system;
};

// One row of cpuacct.usage_all, in nanoseconds.
struct CpuAcctUsage {
  uint32_t cpu;
  uint64_t user;
  uint64_t system;
};

class CpuAcctSubsystem : public SubsystemOf<SubsystemKind::CPUACCT> {
 public:
  static constexpr std::string_view kStatFile = "cpuacct.stat";
  static constexpr std::string_view kUsageFile = "cpuacct.usage";
  static constexpr std::string_view kUsageAllFile = "cpuacct.usage_all";
  static constexpr std::string_view kUsagePerCpuFile = "cpuacct.usage_percpu";
  static constexpr std::string_view kUsagePerCpuUserFile =
      "cpuacct.usage_percpu_user";
  static constexpr std::string_view kUsagePerCpuSysFile =
      "cpuacct.usage_percpu_sys";
  static constexpr std::string_view kUsageUserFile = "cpuacct.usage_user";
  static constexpr std::string_view kUsageSysFile = "cpuacct.usage_sys";

  using SubsystemOf::SubsystemOf;

  bool Configured(const Resources &) const override { return false; }

  // Nothing to configure.
  CgExpected<void> Apply(const Resources &) override { return {}; }

  CgExpected<CpuAcctStat> Stat() const;

  // Nanoseconds.
  CgExpected<uint64_t> Usage() const;
  CgExpected<uint64_t> UsageUser() const;
  CgExpected<uint64_t> UsageSys() const;

  // Indexed by cpu.
  CgExpected<std::vector<uint64_t>> UsagePerCpu() const;
  CgExpected<std::vector<uint64_t>> UsagePerCpuUser() const;
  CgExpected<std::vector<uint64_t>> UsagePerCpuSys() const;

  CgExpected<std::vector<CpuAcctUsage>> UsageAll() const;

  // Zeroes every usage counter.
  CgExpected<void> ResetUsage();
};

}  // namespace cgkit
