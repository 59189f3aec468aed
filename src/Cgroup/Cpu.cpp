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

#include "cgkit/Cpu.h"

namespace cgkit {

CgExpected<void> CpuSubsystem::Validate(const CpuResources &res) {
  if (res.shares && res.shares.value() < kMinShares)
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "cpu shares {} is less than {}",
                                       res.shares.value(), kMinShares));

  if (res.cfs_period_us && (res.cfs_period_us.value() < kMinCfsPeriodUs ||
                            res.cfs_period_us.value() > kMaxCfsPeriodUs))
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "cfs_period_us {} is out of [{}, {}]",
        res.cfs_period_us.value(), kMinCfsPeriodUs, kMaxCfsPeriodUs));

  if (res.cfs_quota_us && res.cfs_quota_us.value() != kUnlimited &&
      res.cfs_quota_us.value() < kMinCfsQuotaUs)
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT,
        "cfs_quota_us {} must be -1 or at least {}", res.cfs_quota_us.value(),
        kMinCfsQuotaUs));

  if (res.rt_period_us && res.rt_period_us.value() == 0)
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "rt_period_us must be positive"));

  if (res.rt_runtime_us && res.rt_runtime_us.value() < kUnlimited)
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "rt_runtime_us {} is less than -1",
                                       res.rt_runtime_us.value()));

  return {};
}

CgExpected<void> CpuSubsystem::Apply(const Resources &resources) {
  if (!resources.cpu) return {};
  const CpuResources &res = resources.cpu.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  batch.WriteIfSet(kSharesFile, res.shares);
  batch.WriteIfSet(kCfsPeriodUsFile, res.cfs_period_us);
  batch.WriteIfSet(kCfsQuotaUsFile, res.cfs_quota_us);
  batch.WriteIfSet(kRtPeriodUsFile, res.rt_period_us);
  batch.WriteIfSet(kRtRuntimeUsFile, res.rt_runtime_us);
  return std::move(batch).Finish();
}

CgExpected<CpuStat> CpuSubsystem::Stat() const {
  auto kv = ReadKeyValues_(kStatFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  const auto &m = kv.value();
  auto nr_periods = m.find("nr_periods");
  auto nr_throttled = m.find("nr_throttled");
  auto throttled_time = m.find("throttled_time");
  if (nr_periods == m.end() || nr_throttled == m.end() ||
      throttled_time == m.end())
    return std::unexpected(ParseErr_(kStatFile, "missing cpu.stat keys"));

  return CpuStat{.nr_periods = nr_periods->second,
                 .nr_throttled = nr_throttled->second,
                 .throttled_time = throttled_time->second};
}

CgExpected<uint64_t> CpuSubsystem::Shares() const {
  return ReadUint64_(kSharesFile);
}

CgExpected<void> CpuSubsystem::SetShares(uint64_t shares) {
  return Apply(Resources{.cpu = CpuResources{.shares = shares}});
}

CgExpected<uint64_t> CpuSubsystem::CfsPeriodUs() const {
  return ReadUint64_(kCfsPeriodUsFile);
}

CgExpected<void> CpuSubsystem::SetCfsPeriodUs(uint64_t period) {
  return Apply(Resources{.cpu = CpuResources{.cfs_period_us = period}});
}

CgExpected<int64_t> CpuSubsystem::CfsQuotaUs() const {
  return ReadInt64_(kCfsQuotaUsFile);
}

CgExpected<void> CpuSubsystem::SetCfsQuotaUs(int64_t quota) {
  return Apply(Resources{.cpu = CpuResources{.cfs_quota_us = quota}});
}

CgExpected<uint64_t> CpuSubsystem::RtPeriodUs() const {
  return ReadUint64_(kRtPeriodUsFile);
}

CgExpected<void> CpuSubsystem::SetRtPeriodUs(uint64_t period) {
  return Apply(Resources{.cpu = CpuResources{.rt_period_us = period}});
}

CgExpected<int64_t> CpuSubsystem::RtRuntimeUs() const {
  return ReadInt64_(kRtRuntimeUsFile);
}

CgExpected<void> CpuSubsystem::SetRtRuntimeUs(int64_t runtime) {
  return Apply(Resources{.cpu = CpuResources{.rt_runtime_us = runtime}});
}

}  // namespace cgkit
