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

struct RdmaUsage {
  uint64_t hca_handle{};
  uint64_t hca_object{};

  bool operator==(const RdmaUsage &rhs) const = default;
};

class RdmaSubsystem : public SubsystemOf<SubsystemKind::RDMA> {
 public:
  static constexpr std::string_view kMaxFile = "rdma.max";
  static constexpr std::string_view kCurrentFile = "rdma.current";

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const RdmaResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.rdma.has_value();
  }

  // One "<device> hca_handle=<v> hca_object=<v>" line per device, in device
  // name order. An unset limit is left out of the line.
  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<std::map<std::string, RdmaLimit>> Max() const;
  CgExpected<std::map<std::string, RdmaUsage>> Current() const;

  CgExpected<void> SetMax(const std::string &device, const RdmaLimit &limit);
};

}  // namespace cgkit
