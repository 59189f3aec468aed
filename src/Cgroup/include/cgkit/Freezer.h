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

class FreezerSubsystem : public SubsystemOf<SubsystemKind::FREEZER> {
 public:
  static constexpr std::string_view kStateFile = "freezer.state";
  static constexpr std::string_view kSelfFreezingFile =
      "freezer.self_freezing";
  static constexpr std::string_view kParentFreezingFile =
      "freezer.parent_freezing";

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const FreezerResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.freezer.has_value();
  }

  CgExpected<void> Apply(const Resources &resources) override;

  /**
   * FREEZING while the kernel is still stopping tasks, or while an
   * ancestor is being frozen. Poll until FROZEN when the caller needs every
   * task stopped.
   */
  CgExpected<FreezerState> State() const;

  CgExpected<bool> SelfFreezing() const;
  CgExpected<bool> ParentFreezing() const;

  CgExpected<void> Freeze();
  CgExpected<void> Thaw();
};

}  // namespace cgkit
