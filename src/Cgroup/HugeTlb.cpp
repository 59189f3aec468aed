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

#include "cgkit/HugeTlb.h"

#include <limits>

namespace cgkit {

namespace {

constexpr std::string_view kLimitInBytes = "limit_in_bytes";
constexpr std::string_view kUsageInBytes = "usage_in_bytes";
constexpr std::string_view kMaxUsageInBytes = "max_usage_in_bytes";
constexpr std::string_view kFailcnt = "failcnt";

CgExpected<void> CheckLimit(HugepageSize size,
                            const std::optional<HugeTlbLimit> &limit) {
  if (!limit || limit->GetUnit() == HugeTlbLimit::Unit::UNLIMITED) return {};

  uint64_t max_amount = std::numeric_limits<int64_t>::max();
  if (limit->GetUnit() == HugeTlbLimit::Unit::PAGES)
    max_amount /= HugepageBytes(size);

  if (limit->Amount() > max_amount)
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "hugetlb {} limit {} {} exceeds {}",
        HugepageSizeStr(size), limit->Amount(),
        limit->GetUnit() == HugeTlbLimit::Unit::PAGES ? "pages" : "bytes",
        max_amount));
  return {};
}

}  // namespace

CgExpected<void> HugeTlbSubsystem::Validate(const HugeTlbResources &res) {
  if (auto ok = CheckLimit(HugepageSize::MB_2, res.limit_2mb); !ok) return ok;
  return CheckLimit(HugepageSize::GB_1, res.limit_1gb);
}

std::string HugeTlbSubsystem::FileName(HugepageSize size,
                                       std::string_view name) {
  return fmt::format("hugetlb.{}.{}", HugepageSizeStr(size), name);
}

CgExpected<void> HugeTlbSubsystem::Apply(const Resources &resources) {
  if (!resources.hugetlb) return {};
  const HugeTlbResources &res = resources.hugetlb.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.limit_2mb)
    batch.Write(FileName(HugepageSize::MB_2, kLimitInBytes),
                res.limit_2mb->ToFileValue(HugepageSize::MB_2));
  if (res.limit_1gb)
    batch.Write(FileName(HugepageSize::GB_1, kLimitInBytes),
                res.limit_1gb->ToFileValue(HugepageSize::GB_1));
  return std::move(batch).Finish();
}

bool HugeTlbSubsystem::SizeSupported(HugepageSize size) const {
  return FileExists(FileName(size, kLimitInBytes)) &&
         FileExists(FileName(size, kUsageInBytes)) &&
         FileExists(FileName(size, kMaxUsageInBytes)) &&
         FileExists(FileName(size, kFailcnt));
}

CgExpected<uint64_t> HugeTlbSubsystem::ReadPages_(HugepageSize size,
                                                  std::string_view name) const {
  auto bytes = ReadUint64_(FileName(size, name));
  if (!bytes) return bytes;
  return bytes.value() / HugepageBytes(size);
}

CgExpected<uint64_t> HugeTlbSubsystem::LimitInBytes(HugepageSize size) const {
  return ReadUint64_(FileName(size, kLimitInBytes));
}

CgExpected<uint64_t> HugeTlbSubsystem::LimitInPages(HugepageSize size) const {
  return ReadPages_(size, kLimitInBytes);
}

CgExpected<void> HugeTlbSubsystem::SetLimit(HugepageSize size,
                                            HugeTlbLimit limit) {
  HugeTlbResources res;
  if (size == HugepageSize::MB_2)
    res.limit_2mb = limit;
  else
    res.limit_1gb = limit;
  return Apply(Resources{.hugetlb = res});
}

CgExpected<uint64_t> HugeTlbSubsystem::UsageInBytes(HugepageSize size) const {
  return ReadUint64_(FileName(size, kUsageInBytes));
}

CgExpected<uint64_t> HugeTlbSubsystem::UsageInPages(HugepageSize size) const {
  return ReadPages_(size, kUsageInBytes);
}

CgExpected<uint64_t> HugeTlbSubsystem::MaxUsageInBytes(
    HugepageSize size) const {
  return ReadUint64_(FileName(size, kMaxUsageInBytes));
}

CgExpected<uint64_t> HugeTlbSubsystem::MaxUsageInPages(
    HugepageSize size) const {
  return ReadPages_(size, kMaxUsageInBytes);
}

CgExpected<uint64_t> HugeTlbSubsystem::Failcnt(HugepageSize size) const {
  return ReadUint64_(FileName(size, kFailcnt));
}

}  // namespace cgkit
