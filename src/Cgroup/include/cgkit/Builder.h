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

#include <memory>
#include <optional>
#include <string>

#include "cgkit/Cgroup.h"

namespace cgkit {

/**
 * Accumulates the controllers and settings of one cgroup, then creates it.
 *
 *   auto cg = Builder("job_1")
 *                 .Cpu().Shares(1000).CfsQuotaUs(500000).Done()
 *                 .CpuSet().Cpus({0}).Done()
 *                 .Build();
 *
 * Every setter checks type and range only. The first rejected value is
 * kept and returned by Build() as INVALID_ARGUMENT before any file system
 * access. Builders are consumed by value: entering a sub-builder, Done()
 * and Build() all take *this as an rvalue.
 */
class Builder {
 public:
  class CpuBuilder;
  class CpuSetBuilder;
  class MemoryBuilder;
  class HugeTlbBuilder;
  class DevicesBuilder;
  class BlkIoBuilder;
  class RdmaBuilder;
  class NetClsBuilder;
  class NetPrioBuilder;
  class PidsBuilder;
  class FreezerBuilder;

  explicit Builder(std::string relative);
  Builder(std::string relative, std::shared_ptr<const Hierarchies> hierarchies);

  CpuBuilder Cpu() &&;
  CpuSetBuilder CpuSet() &&;
  MemoryBuilder Memory() &&;
  HugeTlbBuilder HugeTlb() &&;
  DevicesBuilder Devices() &&;
  BlkIoBuilder BlkIo() &&;
  RdmaBuilder Rdma() &&;
  NetClsBuilder NetCls() &&;
  NetPrioBuilder NetPrio() &&;
  PidsBuilder Pids() &&;
  FreezerBuilder Freezer() &&;

  // Nothing to configure, only included.
  Builder CpuAcct() &&;
  Builder PerfEvent() &&;

  SubsystemFlags Kinds() const { return m_kinds_; }
  const Resources &GetResources() const { return m_resources_; }

  /**
   * Creates the cgroup in every requested hierarchy and applies the
   * settings. On failure returns the error of the first failing
   * subsystem; its description is prefixed with the subsystem name.
   * Directories created before the failure are left in place.
   */
  CgExpected<Cgroup> Build() &&;

 private:
  void Check_(CgExpected<void> valid);

  std::string m_relative_;
  std::shared_ptr<const Hierarchies> m_hierarchies_;
  SubsystemFlags m_kinds_;
  Resources m_resources_;
  std::optional<CgError> m_error_;
};

class Builder::CpuBuilder {
 public:
  CpuBuilder &&Shares(uint64_t shares) &&;
  CpuBuilder &&CfsPeriodUs(uint64_t period) &&;
  // kUnlimited removes the quota.
  CpuBuilder &&CfsQuotaUs(int64_t quota) &&;
  CpuBuilder &&RtPeriodUs(uint64_t period) &&;
  CpuBuilder &&RtRuntimeUs(int64_t runtime) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit CpuBuilder(Builder builder);

  Builder m_builder_;
  CpuResources m_res_;
};

class Builder::CpuSetBuilder {
 public:
  CpuSetBuilder &&Cpus(std::set<uint32_t> cpus) &&;
  CpuSetBuilder &&Mems(std::set<uint32_t> mems) &&;
  CpuSetBuilder &&MemoryMigrate(bool enable) &&;
  CpuSetBuilder &&CpuExclusive(bool enable) &&;
  CpuSetBuilder &&MemExclusive(bool enable) &&;
  CpuSetBuilder &&MemHardwall(bool enable) &&;
  CpuSetBuilder &&MemorySpreadPage(bool enable) &&;
  CpuSetBuilder &&MemorySpreadSlab(bool enable) &&;
  CpuSetBuilder &&SchedLoadBalance(bool enable) &&;
  CpuSetBuilder &&SchedRelaxDomainLevel(int32_t level) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit CpuSetBuilder(Builder builder);

  Builder m_builder_;
  CpuSetResources m_res_;
};

class Builder::MemoryBuilder {
 public:
  // Each limit takes kUnlimited.
  MemoryBuilder &&LimitInBytes(int64_t limit) &&;
  MemoryBuilder &&MemswLimitInBytes(int64_t limit) &&;
  MemoryBuilder &&KmemLimitInBytes(int64_t limit) &&;
  MemoryBuilder &&KmemTcpLimitInBytes(int64_t limit) &&;
  MemoryBuilder &&SoftLimitInBytes(int64_t limit) &&;
  MemoryBuilder &&Swappiness(uint64_t swappiness) &&;
  MemoryBuilder &&MoveChargeAtImmigrate(bool enable) &&;
  MemoryBuilder &&UseHierarchy(bool enable) &&;
  MemoryBuilder &&OomKillDisable(bool disable) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit MemoryBuilder(Builder builder);

  Builder m_builder_;
  MemoryResources m_res_;
};

class Builder::HugeTlbBuilder {
 public:
  HugeTlbBuilder &&Limit(HugepageSize size, HugeTlbLimit limit) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit HugeTlbBuilder(Builder builder);

  Builder m_builder_;
  HugeTlbResources m_res_;
};

class Builder::DevicesBuilder {
 public:
  // Appended in call order.
  DevicesBuilder &&Deny(DeviceRule rule) &&;
  DevicesBuilder &&Allow(DeviceRule rule) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit DevicesBuilder(Builder builder);

  Builder m_builder_;
  DevicesResources m_res_;
};

class Builder::BlkIoBuilder {
 public:
  BlkIoBuilder &&Weight(uint16_t weight) &&;
  BlkIoBuilder &&WeightDevice(DeviceNumber dev, uint16_t weight) &&;
  BlkIoBuilder &&LeafWeight(uint16_t weight) &&;
  BlkIoBuilder &&LeafWeightDevice(DeviceNumber dev, uint16_t weight) &&;
  BlkIoBuilder &&ReadBpsDevice(DeviceNumber dev, uint64_t bps) &&;
  BlkIoBuilder &&WriteBpsDevice(DeviceNumber dev, uint64_t bps) &&;
  BlkIoBuilder &&ReadIopsDevice(DeviceNumber dev, uint64_t iops) &&;
  BlkIoBuilder &&WriteIopsDevice(DeviceNumber dev, uint64_t iops) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit BlkIoBuilder(Builder builder);

  Builder m_builder_;
  BlkIoResources m_res_;
};

class Builder::RdmaBuilder {
 public:
  RdmaBuilder &&Max(const std::string &device, RdmaLimit limit) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit RdmaBuilder(Builder builder);

  Builder m_builder_;
  RdmaResources m_res_;
};

class Builder::NetClsBuilder {
 public:
  NetClsBuilder &&ClassId(uint32_t classid) &&;
  NetClsBuilder &&ClassId(uint16_t major, uint16_t minor) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit NetClsBuilder(Builder builder);

  Builder m_builder_;
  NetClsResources m_res_;
};

class Builder::NetPrioBuilder {
 public:
  NetPrioBuilder &&IfPrio(const std::string &iface, uint32_t prio) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit NetPrioBuilder(Builder builder);

  Builder m_builder_;
  NetPrioResources m_res_;
};

class Builder::PidsBuilder {
 public:
  PidsBuilder &&Max(MaxValue max) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit PidsBuilder(Builder builder);

  Builder m_builder_;
  PidsResources m_res_;
};

class Builder::FreezerBuilder {
 public:
  // FROZEN or THAWED.
  FreezerBuilder &&State(FreezerState state) &&;

  Builder Done() &&;

 private:
  friend class Builder;
  explicit FreezerBuilder(Builder builder);

  Builder m_builder_;
  FreezerResources m_res_;
};

}  // namespace cgkit
