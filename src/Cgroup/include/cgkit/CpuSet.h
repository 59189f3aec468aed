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

class CpuSetSubsystem : public SubsystemOf<SubsystemKind::CPUSET> {
 public:
  static constexpr std::string_view kCpusFile = "cpuset.cpus";
  static constexpr std::string_view kMemsFile = "cpuset.mems";
  static constexpr std::string_view kEffectiveCpusFile =
      "cpuset.effective_cpus";
  static constexpr std::string_view kEffectiveMemsFile =
      "cpuset.effective_mems";
  static constexpr std::string_view kMemoryMigrateFile =
      "cpuset.memory_migrate";
  static constexpr std::string_view kCpuExclusiveFile = "cpuset.cpu_exclusive";
  static constexpr std::string_view kMemExclusiveFile = "cpuset.mem_exclusive";
  static constexpr std::string_view kMemHardwallFile = "cpuset.mem_hardwall";
  static constexpr std::string_view kMemoryPressureFile =
      "cpuset.memory_pressure";
  static constexpr std::string_view kMemoryPressureEnabledFile =
      "cpuset.memory_pressure_enabled";
  static constexpr std::string_view kMemorySpreadPageFile =
      "cpuset.memory_spread_page";
  static constexpr std::string_view kMemorySpreadSlabFile =
      "cpuset.memory_spread_slab";
  static constexpr std::string_view kSchedLoadBalanceFile =
      "cpuset.sched_load_balance";
  static constexpr std::string_view kSchedRelaxDomainLevelFile =
      "cpuset.sched_relax_domain_level";

  static constexpr int32_t kMinRelaxDomainLevel = -1;
  static constexpr int32_t kMaxRelaxDomainLevel = 5;

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const CpuSetResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.cpuset.has_value();
  }

  // cpus and mems go first, a cpuset without them cannot take tasks.
  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<std::set<uint32_t>> Cpus() const;
  CgExpected<void> SetCpus(const std::set<uint32_t> &cpus);

  CgExpected<std::set<uint32_t>> Mems() const;
  CgExpected<void> SetMems(const std::set<uint32_t> &mems);

  CgExpected<std::set<uint32_t>> EffectiveCpus() const;
  CgExpected<std::set<uint32_t>> EffectiveMems() const;

  CgExpected<bool> MemoryMigrate() const;
  CgExpected<bool> CpuExclusive() const;
  CgExpected<bool> MemExclusive() const;
  CgExpected<bool> MemHardwall() const;
  CgExpected<bool> MemorySpreadPage() const;
  CgExpected<bool> MemorySpreadSlab() const;
  CgExpected<bool> SchedLoadBalance() const;
  CgExpected<int32_t> SchedRelaxDomainLevel() const;

  // Running average of the direct reclaim rate of this cpuset.
  CgExpected<uint64_t> MemoryPressure() const;

  // Root only. Toggles memory_pressure accounting for the whole system.
  CgExpected<bool> MemoryPressureEnabled() const;
  CgExpected<void> SetMemoryPressureEnabled(bool enable);
};

}  // namespace cgkit
