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

struct CpuStat {
  uint64_t nr_periods;
  uint64_t nr_throttled;
  // Nanoseconds.
  uint64_t throttled_time;
};

class CpuSubsystem : public SubsystemOf<SubsystemKind::CPU> {
 public:
  static constexpr std::string_view kSharesFile = "cpu.shares";
  static constexpr std::string_view kCfsPeriodUsFile = "cpu.cfs_period_us";
  static constexpr std::string_view kCfsQuotaUsFile = "cpu.cfs_quota_us";
  static constexpr std::string_view kRtPeriodUsFile = "cpu.rt_period_us";
  static constexpr std::string_view kRtRuntimeUsFile = "cpu.rt_runtime_us";
  static constexpr std::string_view kStatFile = "cpu.stat";

  static constexpr uint64_t kMinShares = 2;
  static constexpr uint64_t kMinCfsPeriodUs = 1000;
  static constexpr uint64_t kMaxCfsPeriodUs = 1000000;
  static constexpr int64_t kMinCfsQuotaUs = 1000;

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const CpuResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.cpu.has_value();
  }

  // shares, cfs_period_us, cfs_quota_us, rt_period_us, rt_runtime_us.
  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<CpuStat> Stat() const;

  CgExpected<uint64_t> Shares() const;
  CgExpected<void> SetShares(uint64_t shares);

  CgExpected<uint64_t> CfsPeriodUs() const;
  CgExpected<void> SetCfsPeriodUs(uint64_t period);

  // kUnlimited when no quota is set.
  CgExpected<int64_t> CfsQuotaUs() const;
  CgExpected<void> SetCfsQuotaUs(int64_t quota);

  CgExpected<uint64_t> RtPeriodUs() const;
  CgExpected<void> SetRtPeriodUs(uint64_t period);

  CgExpected<int64_t> RtRuntimeUs() const;
  CgExpected<void> SetRtRuntimeUs(int64_t runtime);
};

}  // namespace cgkit
