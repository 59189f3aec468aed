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

#include "cgkit/CpuSet.h"

#include "cgkit/String.h"

namespace cgkit {

CgExpected<void> CpuSetSubsystem::Validate(const CpuSetResources &res) {
  if (res.sched_relax_domain_level &&
      (res.sched_relax_domain_level.value() < kMinRelaxDomainLevel ||
       res.sched_relax_domain_level.value() > kMaxRelaxDomainLevel))
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT,
        "sched_relax_domain_level {} is out of [{}, {}]",
        res.sched_relax_domain_level.value(), kMinRelaxDomainLevel,
        kMaxRelaxDomainLevel));

  return {};
}

CgExpected<void> CpuSetSubsystem::Apply(const Resources &resources) {
  if (!resources.cpuset) return {};
  const CpuSetResources &res = resources.cpuset.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.cpus) batch.Write(kCpusFile, util::FormatIdList(res.cpus.value()));
  if (res.mems) batch.Write(kMemsFile, util::FormatIdList(res.mems.value()));
  batch.WriteIfSet(kMemoryMigrateFile, res.memory_migrate);
  batch.WriteIfSet(kCpuExclusiveFile, res.cpu_exclusive);
  batch.WriteIfSet(kMemExclusiveFile, res.mem_exclusive);
  batch.WriteIfSet(kMemHardwallFile, res.mem_hardwall);
  batch.WriteIfSet(kMemorySpreadPageFile, res.memory_spread_page);
  batch.WriteIfSet(kMemorySpreadSlabFile, res.memory_spread_slab);
  batch.WriteIfSet(kSchedLoadBalanceFile, res.sched_load_balance);
  batch.WriteIfSet(kSchedRelaxDomainLevelFile, res.sched_relax_domain_level);
  return std::move(batch).Finish();
}

CgExpected<std::set<uint32_t>> CpuSetSubsystem::Cpus() const {
  return ReadIdList_(kCpusFile);
}

CgExpected<void> CpuSetSubsystem::SetCpus(const std::set<uint32_t> &cpus) {
  return Apply(Resources{.cpuset = CpuSetResources{.cpus = cpus}});
}

CgExpected<std::set<uint32_t>> CpuSetSubsystem::Mems() const {
  return ReadIdList_(kMemsFile);
}

CgExpected<void> CpuSetSubsystem::SetMems(const std::set<uint32_t> &mems) {
  return Apply(Resources{.cpuset = CpuSetResources{.mems = mems}});
}

CgExpected<std::set<uint32_t>> CpuSetSubsystem::EffectiveCpus() const {
  return ReadIdList_(kEffectiveCpusFile);
}

CgExpected<std::set<uint32_t>> CpuSetSubsystem::EffectiveMems() const {
  return ReadIdList_(kEffectiveMemsFile);
}

CgExpected<bool> CpuSetSubsystem::MemoryMigrate() const {
  return ReadBool01_(kMemoryMigrateFile);
}

CgExpected<bool> CpuSetSubsystem::CpuExclusive() const {
  return ReadBool01_(kCpuExclusiveFile);
}

CgExpected<bool> CpuSetSubsystem::MemExclusive() const {
  return ReadBool01_(kMemExclusiveFile);
}

CgExpected<bool> CpuSetSubsystem::MemHardwall() const {
  return ReadBool01_(kMemHardwallFile);
}

CgExpected<bool> CpuSetSubsystem::MemorySpreadPage() const {
  return ReadBool01_(kMemorySpreadPageFile);
}

CgExpected<bool> CpuSetSubsystem::MemorySpreadSlab() const {
  return ReadBool01_(kMemorySpreadSlabFile);
}

CgExpected<bool> CpuSetSubsystem::SchedLoadBalance() const {
  return ReadBool01_(kSchedLoadBalanceFile);
}

CgExpected<int32_t> CpuSetSubsystem::SchedRelaxDomainLevel() const {
  auto v = ReadInt64_(kSchedRelaxDomainLevelFile);
  if (!v) return std::unexpected(std::move(v).error());
  return static_cast<int32_t>(v.value());
}

CgExpected<uint64_t> CpuSetSubsystem::MemoryPressure() const {
  return ReadUint64_(kMemoryPressureFile);
}

CgExpected<bool> CpuSetSubsystem::MemoryPressureEnabled() const {
  if (auto ok = RequireRoot_(kMemoryPressureEnabledFile); !ok)
    return std::unexpected(std::move(ok).error());
  return ReadBool01_(kMemoryPressureEnabledFile);
}

CgExpected<void> CpuSetSubsystem::SetMemoryPressureEnabled(bool enable) {
  if (auto ok = RequireRoot_(kMemoryPressureEnabledFile); !ok) return ok;
  return WriteFile(kMemoryPressureEnabledFile, enable ? "1" : "0");
}

}  // namespace cgkit
