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

#include "cgkit/Cgroup.h"

#include <absl/strings/str_join.h>

#include <cerrno>
#include <set>
#include <utility>

#include "cgkit/BlkIo.h"
#include "cgkit/Cpu.h"
#include "cgkit/CpuAcct.h"
#include "cgkit/CpuSet.h"
#include "cgkit/Devices.h"
#include "cgkit/Freezer.h"
#include "cgkit/HugeTlb.h"
#include "cgkit/Memory.h"
#include "cgkit/NetCls.h"
#include "cgkit/NetPrio.h"
#include "cgkit/PerfEvent.h"
#include "cgkit/Pids.h"
#include "cgkit/Rdma.h"

namespace cgkit {

std::unique_ptr<Subsystem> MakeSubsystem(
    SubsystemKind kind, const CgroupPath &path,
    std::shared_ptr<const Hierarchies> hierarchies) {
  switch (kind) {
  case SubsystemKind::CPU:
    return std::make_unique<CpuSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::CPUSET:
    return std::make_unique<CpuSetSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::CPUACCT:
    return std::make_unique<CpuAcctSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::MEMORY:
    return std::make_unique<MemorySubsystem>(path, std::move(hierarchies));
  case SubsystemKind::HUGETLB:
    return std::make_unique<HugeTlbSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::DEVICES:
    return std::make_unique<DevicesSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::BLKIO:
    return std::make_unique<BlkIoSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::RDMA:
    return std::make_unique<RdmaSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::NET_CLS:
    return std::make_unique<NetClsSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::NET_PRIO:
    return std::make_unique<NetPrioSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::PIDS:
    return std::make_unique<PidsSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::FREEZER:
    return std::make_unique<FreezerSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::PERF_EVENT:
    return std::make_unique<PerfEventSubsystem>(path, std::move(hierarchies));
  case SubsystemKind::SUBSYSTEM_COUNT:
    break;
  }
  std::unreachable();
}

Cgroup::Cgroup(SubsystemFlags kinds, std::string_view relative,
               std::shared_ptr<const Hierarchies> hierarchies)
    : m_kinds_(kinds), m_hierarchies_(std::move(hierarchies)) {
  CGKIT_ASSERT(m_hierarchies_ != nullptr);

  CgroupPath path(SubsystemKind::CPU, relative);
  m_relative_ = path.Relative();
  for (SubsystemKind kind : kinds.Kinds())
    m_subsystems_[static_cast<size_t>(kind)] =
        MakeSubsystem(kind, path, m_hierarchies_);
}

CgExpected<Cgroup> Cgroup::Make(
    SubsystemFlags kinds, std::string_view relative,
    std::shared_ptr<const Hierarchies> hierarchies) {
  auto path = CgroupPath::Make(SubsystemKind::CPU, relative);
  if (!path) return std::unexpected(std::move(path).error());
  return Cgroup(kinds, path->Relative(), std::move(hierarchies));
}

template <typename F>
CgExpected<void> Cgroup::ForEach_(std::string_view action, F &&op) const {
  std::vector<CgSubsystemFailure> failures;
  for (const auto &subsystem : m_subsystems_) {
    if (!subsystem) continue;

    CgExpected<void> result = op(*subsystem);
    if (result) continue;

    CgError err = std::move(result).error();
    err.description =
        fmt::format("[{}] {}", subsystem->Kind(), err.description);
    failures.emplace_back(
        CgSubsystemFailure{.kind = subsystem->Kind(), .error = std::move(err)});
  }

  if (failures.empty()) return {};

  std::vector<std::string_view> names;
  for (const auto &f : failures)
    names.emplace_back(CgConstant::GetSubsystemStringView(f.kind));

  CgError err = FormatCgErr(CgErrCode::PARTIAL_FAILURE,
                            "{} of cgroup '{}' failed on {}", action,
                            m_relative_, absl::StrJoin(names, ","));
  err.failures = std::move(failures);
  CGKIT_WARN("{}", err.description);
  return std::unexpected(std::move(err));
}

CgExpected<void> Cgroup::Create() {
  return ForEach_("Create", [](Subsystem &s) { return s.Create(); });
}

CgExpected<void> Cgroup::Delete() {
  return ForEach_("Delete", [](Subsystem &s) -> CgExpected<void> {
    auto result = s.Delete();
    if (!result && result.error().code == CgErrCode::IO &&
        result.error().sys_errno == ENOENT)
      return {};
    return result;
  });
}

CgExpected<void> Cgroup::AddTask(Pid pid) {
  return ForEach_("AddTask", [pid](Subsystem &s) { return s.AddTask(pid); });
}

CgExpected<void> Cgroup::AddProc(Pid pid) {
  return ForEach_("AddProc", [pid](Subsystem &s) { return s.AddProc(pid); });
}

CgExpected<void> Cgroup::RemoveTask(Pid pid) {
  return ForEach_("RemoveTask",
                  [pid](Subsystem &s) { return s.RemoveTask(pid); });
}

CgExpected<void> Cgroup::RemoveProc(Pid pid) {
  return ForEach_("RemoveProc",
                  [pid](Subsystem &s) { return s.RemoveProc(pid); });
}

CgExpected<void> Cgroup::Apply(const Resources &resources) {
  return ForEach_("Apply", [&resources](Subsystem &s) -> CgExpected<void> {
    if (!s.Configured(resources)) return {};
    return s.Apply(resources);
  });
}

CgExpected<std::vector<Pid>> Cgroup::CollectPids_(
    std::string_view action,
    CgExpected<std::vector<Pid>> (Subsystem::*read)() const) const {
  std::set<Pid> pids;
  auto result =
      ForEach_(action, [&pids, read](const Subsystem &s) -> CgExpected<void> {
        auto part = (s.*read)();
        if (!part) return std::unexpected(std::move(part).error());
        pids.insert(part->begin(), part->end());
        return {};
      });
  if (!result) return std::unexpected(std::move(result).error());
  return std::vector<Pid>(pids.begin(), pids.end());
}

CgExpected<std::vector<Pid>> Cgroup::Tasks() const {
  return CollectPids_("Tasks", &Subsystem::Tasks);
}

CgExpected<std::vector<Pid>> Cgroup::Procs() const {
  return CollectPids_("Procs", &Subsystem::Procs);
}

}  // namespace cgkit
