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

class NetClsSubsystem : public SubsystemOf<SubsystemKind::NET_CLS> {
 public:
  static constexpr std::string_view kClassIdFile = "net_cls.classid";

  using SubsystemOf::SubsystemOf;

  bool Configured(const Resources &resources) const override {
    return resources.net_cls.has_value();
  }

  CgExpected<void> Apply(const Resources &resources) override;

  // The kernel prints the class id in decimal.
  CgExpected<uint32_t> ClassId() const;
  CgExpected<void> SetClassId(uint32_t classid);
};

}  // namespace cgkit
