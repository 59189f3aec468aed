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

class HugeTlbSubsystem : public SubsystemOf<SubsystemKind::HUGETLB> {
 public:
  using SubsystemOf::SubsystemOf;

  // "hugetlb.<size>.<name>", e.g. hugetlb.2MB.limit_in_bytes.
  static std::string FileName(HugepageSize size, std::string_view name);

  // A limit must fit in a signed 64-bit byte count once pages are
  // converted to bytes.
  static CgExpected<void> Validate(const HugeTlbResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.hugetlb.has_value();
  }

  // limit_2mb, then limit_1gb.
  CgExpected<void> Apply(const Resources &resources) override;

  // False when any of the four files for size is missing, which includes a
  // cgroup that has not been created yet.
  bool SizeSupported(HugepageSize size) const;

  CgExpected<uint64_t> LimitInBytes(HugepageSize size) const;
  CgExpected<uint64_t> LimitInPages(HugepageSize size) const;
  CgExpected<void> SetLimit(HugepageSize size, HugeTlbLimit limit);

  CgExpected<uint64_t> UsageInBytes(HugepageSize size) const;
  CgExpected<uint64_t> UsageInPages(HugepageSize size) const;

  CgExpected<uint64_t> MaxUsageInBytes(HugepageSize size) const;
  CgExpected<uint64_t> MaxUsageInPages(HugepageSize size) const;

  CgExpected<uint64_t> Failcnt(HugepageSize size) const;

 private:
  CgExpected<uint64_t> ReadPages_(HugepageSize size,
                                  std::string_view name) const;
};

}  // namespace cgkit
