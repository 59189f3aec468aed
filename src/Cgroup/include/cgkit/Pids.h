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

struct PidsEvents {
  // Forks rejected because pids.max was reached.
  uint64_t max;
};

class PidsSubsystem : public SubsystemOf<SubsystemKind::PIDS> {
 public:
  static constexpr std::string_view kMaxFile = "pids.max";
  static constexpr std::string_view kCurrentFile = "pids.current";
  static constexpr std::string_view kEventsFile = "pids.events";

  using SubsystemOf::SubsystemOf;

  bool Configured(const Resources &resources) const override {
    return resources.pids.has_value();
  }

  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<MaxValue> Max() const;
  CgExpected<void> SetMax(MaxValue max);

  CgExpected<uint64_t> Current() const;
  CgExpected<PidsEvents> Events() const;
};

}  // namespace cgkit
