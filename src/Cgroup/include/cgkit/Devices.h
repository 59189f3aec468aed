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

class DevicesSubsystem : public SubsystemOf<SubsystemKind::DEVICES> {
 public:
  static constexpr std::string_view kAllowFile = "devices.allow";
  static constexpr std::string_view kDenyFile = "devices.deny";
  static constexpr std::string_view kListFile = "devices.list";

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const DevicesResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.devices.has_value();
  }

  // deny rules first, then allow rules, one write(2) per rule in the given
  // order.
  CgExpected<void> Apply(const Resources &resources) override;

  // Access currently granted, from devices.list.
  CgExpected<std::vector<DeviceRule>> List() const;

  CgExpected<void> Allow(const std::vector<DeviceRule> &rules);
  CgExpected<void> Deny(const std::vector<DeviceRule> &rules);
};

}  // namespace cgkit
