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

#include "cgkit/Builder.h"

#include "cgkit/BlkIo.h"
#include "cgkit/Cpu.h"
#include "cgkit/CpuSet.h"
#include "cgkit/Devices.h"
#include "cgkit/Freezer.h"
#include "cgkit/HugeTlb.h"
#include "cgkit/Memory.h"
#include "cgkit/NetPrio.h"
#include "cgkit/Rdma.h"

namespace cgkit {

namespace {

// The error of the first failing subsystem of an aggregate.
CgError FirstFailure(CgError err) {
  if (err.code == CgErrCode::PARTIAL_FAILURE && !err.failures.empty())
    return std::move(err.failures.front().error);
  return err;
}

}  // namespace

Builder::Builder(std::string relative)
    : Builder(std::move(relative),
              std::make_shared<const Hierarchies>(Hierarchies::Standard())) {}

Builder::Builder(std::string relative,
                 std::shared_ptr<const Hierarchies> hierarchies)
    : m_relative_(std::move(relative)),
      m_hierarchies_(std::move(hierarchies)) {}

void Builder::Check_(CgExpected<void> valid) {
  if (valid || m_error_) return;
  CGKIT_DEBUG("Builder of cgroup '{}' rejected a value: {}", m_relative_,
              valid.error().description);
  m_error_ = std::move(valid).error();
}

Builder::CpuBuilder Builder::Cpu() && { return CpuBuilder(std::move(*this)); }
Builder::CpuSetBuilder Builder::CpuSet() && {
  return CpuSetBuilder(std::move(*this));
}
Builder::MemoryBuilder Builder::Memory() && {
  return MemoryBuilder(std::move(*this));
}
Builder::HugeTlbBuilder Builder::HugeTlb() && {
  return HugeTlbBuilder(std::move(*this));
}
Builder::DevicesBuilder Builder::Devices() && {
  return DevicesBuilder(std::move(*this));
}
Builder::BlkIoBuilder Builder::BlkIo() && {
  return BlkIoBuilder(std::move(*this));
}
Builder::RdmaBuilder Builder::Rdma() && {
  return RdmaBuilder(std::move(*this));
}
Builder::NetClsBuilder Builder::NetCls() && {
  return NetClsBuilder(std::move(*this));
}
Builder::NetPrioBuilder Builder::NetPrio() && {
  return NetPrioBuilder(std::move(*this));
}
Builder::PidsBuilder Builder::Pids() && {
  return PidsBuilder(std::move(*this));
}
Builder::FreezerBuilder Builder::Freezer() && {
  return FreezerBuilder(std::move(*this));
}

Builder Builder::CpuAcct() && {
  m_kinds_ |= SubsystemKind::CPUACCT;
  return std::move(*this);
}

Builder Builder::PerfEvent() && {
  m_kinds_ |= SubsystemKind::PERF_EVENT;
  return std::move(*this);
}

CgExpected<Cgroup> Builder::Build() && {
  if (m_error_) {
    CGKIT_WARN("Refusing to build cgroup '{}': {}", m_relative_,
               m_error_->description);
    return std::unexpected(std::move(m_error_).value());
  }

  if (m_kinds_.Empty())
    return std::unexpected(
        FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                    "No subsystem requested for cgroup '{}'", m_relative_));

  auto cgroup = Cgroup::Make(m_kinds_, m_relative_, m_hierarchies_);
  if (!cgroup) return std::unexpected(std::move(cgroup).error());

  if (auto ok = cgroup->Create(); !ok)
    return std::unexpected(FirstFailure(std::move(ok).error()));

  if (auto ok = cgroup->Apply(m_resources_); !ok)
    return std::unexpected(FirstFailure(std::move(ok).error()));

  CGKIT_DEBUG("Built cgroup '{}'", cgroup->Relative());
  return cgroup;
}

Builder::CpuBuilder::CpuBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.cpu)
    m_res_ = m_builder_.m_resources_.cpu.value();
}

Builder Builder::CpuBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::CPU;
  m_builder_.m_resources_.cpu = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::CpuBuilder &&Builder::CpuBuilder::Shares(uint64_t shares) && {
  m_builder_.Check_(CpuSubsystem::Validate(CpuResources{.shares = shares}));
  m_res_.shares = shares;
  return std::move(*this);
}

Builder::CpuBuilder &&Builder::CpuBuilder::CfsPeriodUs(uint64_t period) && {
  m_builder_.Check_(
      CpuSubsystem::Validate(CpuResources{.cfs_period_us = period}));
  m_res_.cfs_period_us = period;
  return std::move(*this);
}

Builder::CpuBuilder &&Builder::CpuBuilder::CfsQuotaUs(int64_t quota) && {
  m_builder_.Check_(
      CpuSubsystem::Validate(CpuResources{.cfs_quota_us = quota}));
  m_res_.cfs_quota_us = quota;
  return std::move(*this);
}

Builder::CpuBuilder &&Builder::CpuBuilder::RtPeriodUs(uint64_t period) && {
  m_builder_.Check_(
      CpuSubsystem::Validate(CpuResources{.rt_period_us = period}));
  m_res_.rt_period_us = period;
  return std::move(*this);
}

Builder::CpuBuilder &&Builder::CpuBuilder::RtRuntimeUs(int64_t runtime) && {
  m_builder_.Check_(
      CpuSubsystem::Validate(CpuResources{.rt_runtime_us = runtime}));
  m_res_.rt_runtime_us = runtime;
  return std::move(*this);
}

Builder::CpuSetBuilder::CpuSetBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.cpuset)
    m_res_ = m_builder_.m_resources_.cpuset.value();
}

Builder Builder::CpuSetBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::CPUSET;
  m_builder_.m_resources_.cpuset = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::Cpus(
    std::set<uint32_t> cpus) && {
  m_res_.cpus = std::move(cpus);
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::Mems(
    std::set<uint32_t> mems) && {
  m_res_.mems = std::move(mems);
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::MemoryMigrate(bool enable) && {
  m_res_.memory_migrate = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::CpuExclusive(bool enable) && {
  m_res_.cpu_exclusive = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::MemExclusive(bool enable) && {
  m_res_.mem_exclusive = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::MemHardwall(bool enable) && {
  m_res_.mem_hardwall = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::MemorySpreadPage(
    bool enable) && {
  m_res_.memory_spread_page = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::MemorySpreadSlab(
    bool enable) && {
  m_res_.memory_spread_slab = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::SchedLoadBalance(
    bool enable) && {
  m_res_.sched_load_balance = enable;
  return std::move(*this);
}

Builder::CpuSetBuilder &&Builder::CpuSetBuilder::SchedRelaxDomainLevel(
    int32_t level) && {
  m_builder_.Check_(CpuSetSubsystem::Validate(
      CpuSetResources{.sched_relax_domain_level = level}));
  m_res_.sched_relax_domain_level = level;
  return std::move(*this);
}

Builder::MemoryBuilder::MemoryBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.memory)
    m_res_ = m_builder_.m_resources_.memory.value();
}

Builder Builder::MemoryBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::MEMORY;
  m_builder_.m_resources_.memory = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::LimitInBytes(
    int64_t limit) && {
  m_builder_.Check_(
      MemorySubsystem::Validate(MemoryResources{.limit_in_bytes = limit}));
  m_res_.limit_in_bytes = limit;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::MemswLimitInBytes(
    int64_t limit) && {
  m_builder_.Check_(MemorySubsystem::Validate(
      MemoryResources{.memsw_limit_in_bytes = limit}));
  m_res_.memsw_limit_in_bytes = limit;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::KmemLimitInBytes(
    int64_t limit) && {
  m_builder_.Check_(
      MemorySubsystem::Validate(MemoryResources{.kmem_limit_in_bytes = limit}));
  m_res_.kmem_limit_in_bytes = limit;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::KmemTcpLimitInBytes(
    int64_t limit) && {
  m_builder_.Check_(MemorySubsystem::Validate(
      MemoryResources{.kmem_tcp_limit_in_bytes = limit}));
  m_res_.kmem_tcp_limit_in_bytes = limit;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::SoftLimitInBytes(
    int64_t limit) && {
  m_builder_.Check_(
      MemorySubsystem::Validate(MemoryResources{.soft_limit_in_bytes = limit}));
  m_res_.soft_limit_in_bytes = limit;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::Swappiness(
    uint64_t swappiness) && {
  m_builder_.Check_(
      MemorySubsystem::Validate(MemoryResources{.swappiness = swappiness}));
  m_res_.swappiness = swappiness;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::MoveChargeAtImmigrate(
    bool enable) && {
  m_res_.move_charge_at_immigrate = enable;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::UseHierarchy(bool enable) && {
  m_res_.use_hierarchy = enable;
  return std::move(*this);
}

Builder::MemoryBuilder &&Builder::MemoryBuilder::OomKillDisable(
    bool disable) && {
  m_res_.oom_kill_disable = disable;
  return std::move(*this);
}

Builder::HugeTlbBuilder::HugeTlbBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.hugetlb)
    m_res_ = m_builder_.m_resources_.hugetlb.value();
}

Builder Builder::HugeTlbBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::HUGETLB;
  m_builder_.m_resources_.hugetlb = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::HugeTlbBuilder &&Builder::HugeTlbBuilder::Limit(
    HugepageSize size, HugeTlbLimit limit) && {
  HugeTlbResources res;
  if (size == HugepageSize::MB_2)
    res.limit_2mb = limit;
  else
    res.limit_1gb = limit;
  m_builder_.Check_(HugeTlbSubsystem::Validate(res));

  if (size == HugepageSize::MB_2)
    m_res_.limit_2mb = limit;
  else
    m_res_.limit_1gb = limit;
  return std::move(*this);
}

Builder::DevicesBuilder::DevicesBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.devices)
    m_res_ = m_builder_.m_resources_.devices.value();
}

Builder Builder::DevicesBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::DEVICES;
  m_builder_.m_resources_.devices = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::DevicesBuilder &&Builder::DevicesBuilder::Deny(DeviceRule rule) && {
  m_builder_.Check_(DevicesSubsystem::Validate(
      DevicesResources{.deny = std::vector<DeviceRule>{rule}}));
  if (!m_res_.deny) m_res_.deny.emplace();
  m_res_.deny->emplace_back(std::move(rule));
  return std::move(*this);
}

Builder::DevicesBuilder &&Builder::DevicesBuilder::Allow(DeviceRule rule) && {
  m_builder_.Check_(DevicesSubsystem::Validate(
      DevicesResources{.allow = std::vector<DeviceRule>{rule}}));
  if (!m_res_.allow) m_res_.allow.emplace();
  m_res_.allow->emplace_back(std::move(rule));
  return std::move(*this);
}

Builder::BlkIoBuilder::BlkIoBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.blkio)
    m_res_ = m_builder_.m_resources_.blkio.value();
}

Builder Builder::BlkIoBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::BLKIO;
  m_builder_.m_resources_.blkio = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::Weight(uint16_t weight) && {
  m_builder_.Check_(BlkIoSubsystem::Validate(BlkIoResources{.weight = weight}));
  m_res_.weight = weight;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::LeafWeight(uint16_t weight) && {
  m_builder_.Check_(
      BlkIoSubsystem::Validate(BlkIoResources{.leaf_weight = weight}));
  m_res_.leaf_weight = weight;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::WeightDevice(
    DeviceNumber dev, uint16_t weight) && {
  m_builder_.Check_(BlkIoSubsystem::Validate(BlkIoResources{
      .weight_device = std::map<DeviceNumber, uint16_t>{{dev, weight}}}));
  if (!m_res_.weight_device) m_res_.weight_device.emplace();
  (*m_res_.weight_device)[dev] = weight;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::LeafWeightDevice(
    DeviceNumber dev, uint16_t weight) && {
  m_builder_.Check_(BlkIoSubsystem::Validate(BlkIoResources{
      .leaf_weight_device = std::map<DeviceNumber, uint16_t>{{dev, weight}}}));
  if (!m_res_.leaf_weight_device) m_res_.leaf_weight_device.emplace();
  (*m_res_.leaf_weight_device)[dev] = weight;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::ReadBpsDevice(
    DeviceNumber dev, uint64_t bps) && {
  if (!m_res_.read_bps_device) m_res_.read_bps_device.emplace();
  (*m_res_.read_bps_device)[dev] = bps;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::WriteBpsDevice(
    DeviceNumber dev, uint64_t bps) && {
  if (!m_res_.write_bps_device) m_res_.write_bps_device.emplace();
  (*m_res_.write_bps_device)[dev] = bps;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::ReadIopsDevice(
    DeviceNumber dev, uint64_t iops) && {
  if (!m_res_.read_iops_device) m_res_.read_iops_device.emplace();
  (*m_res_.read_iops_device)[dev] = iops;
  return std::move(*this);
}

Builder::BlkIoBuilder &&Builder::BlkIoBuilder::WriteIopsDevice(
    DeviceNumber dev, uint64_t iops) && {
  if (!m_res_.write_iops_device) m_res_.write_iops_device.emplace();
  (*m_res_.write_iops_device)[dev] = iops;
  return std::move(*this);
}

Builder::RdmaBuilder::RdmaBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.rdma)
    m_res_ = m_builder_.m_resources_.rdma.value();
}

Builder Builder::RdmaBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::RDMA;
  m_builder_.m_resources_.rdma = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::RdmaBuilder &&Builder::RdmaBuilder::Max(const std::string &device,
                                                 RdmaLimit limit) && {
  m_builder_.Check_(RdmaSubsystem::Validate(RdmaResources{
      .max = std::map<std::string, RdmaLimit>{{device, limit}}}));
  if (!m_res_.max) m_res_.max.emplace();
  (*m_res_.max)[device] = limit;
  return std::move(*this);
}

Builder::NetClsBuilder::NetClsBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.net_cls)
    m_res_ = m_builder_.m_resources_.net_cls.value();
}

Builder Builder::NetClsBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::NET_CLS;
  m_builder_.m_resources_.net_cls = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::NetClsBuilder &&Builder::NetClsBuilder::ClassId(uint32_t classid) && {
  m_res_.classid = classid;
  return std::move(*this);
}

Builder::NetClsBuilder &&Builder::NetClsBuilder::ClassId(uint16_t major,
                                                         uint16_t minor) && {
  m_res_.classid = MakeClassId(major, minor);
  return std::move(*this);
}

Builder::NetPrioBuilder::NetPrioBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.net_prio)
    m_res_ = m_builder_.m_resources_.net_prio.value();
}

Builder Builder::NetPrioBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::NET_PRIO;
  m_builder_.m_resources_.net_prio = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::NetPrioBuilder &&Builder::NetPrioBuilder::IfPrio(
    const std::string &iface, uint32_t prio) && {
  m_builder_.Check_(NetPrioSubsystem::Validate(NetPrioResources{
      .ifpriomap = std::map<std::string, uint32_t>{{iface, prio}}}));
  if (!m_res_.ifpriomap) m_res_.ifpriomap.emplace();
  (*m_res_.ifpriomap)[iface] = prio;
  return std::move(*this);
}

Builder::PidsBuilder::PidsBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.pids)
    m_res_ = m_builder_.m_resources_.pids.value();
}

Builder Builder::PidsBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::PIDS;
  m_builder_.m_resources_.pids = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::PidsBuilder &&Builder::PidsBuilder::Max(MaxValue max) && {
  m_res_.max = max;
  return std::move(*this);
}

Builder::FreezerBuilder::FreezerBuilder(Builder builder)
    : m_builder_(std::move(builder)) {
  if (m_builder_.m_resources_.freezer)
    m_res_ = m_builder_.m_resources_.freezer.value();
}

Builder Builder::FreezerBuilder::Done() && {
  m_builder_.m_kinds_ |= SubsystemKind::FREEZER;
  m_builder_.m_resources_.freezer = std::move(m_res_);
  return std::move(m_builder_);
}

Builder::FreezerBuilder &&Builder::FreezerBuilder::State(
    FreezerState state) && {
  m_builder_.Check_(
      FreezerSubsystem::Validate(FreezerResources{.state = state}));
  m_res_.state = state;
  return std::move(*this);
}

}  // namespace cgkit
