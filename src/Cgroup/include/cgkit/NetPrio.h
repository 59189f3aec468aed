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

class NetPrioSubsystem : public SubsystemOf<SubsystemKind::NET_PRIO> {
 public:
  static constexpr std::string_view kPrioIdxFile = "net_prio.prioidx";
  static constexpr std::string_view kIfPrioMapFile = "net_prio.ifpriomap";

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const NetPrioResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.net_prio.has_value();
  }

  // One "<interface> <priority>" write per interface, in name order.
  CgExpected<void> Apply(const Resources &resources) override;

  // Kernel internal index of this cgroup, read only.
  CgExpected<uint32_t> PrioIdx() const;

  CgExpected<std::map<std::string, uint32_t>> IfPrioMap() const;
  CgExpected<void> SetIfPrio(const std::string &iface, uint32_t prio);
};

}  // namespace cgkit
