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

#include "cgkit/Freezer.h"

namespace cgkit {

CgExpected<void> FreezerSubsystem::Validate(const FreezerResources &res) {
  if (res.state && res.state.value() == FreezerState::FREEZING)
    return std::unexpected(
        FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                    "FREEZING is a transient freezer state and can't be set"));
  return {};
}

CgExpected<void> FreezerSubsystem::Apply(const Resources &resources) {
  if (!resources.freezer) return {};
  const FreezerResources &res = resources.freezer.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.state) batch.Write(kStateFile, FreezerStateStr(res.state.value()));
  return std::move(batch).Finish();
}

CgExpected<FreezerState> FreezerSubsystem::State() const {
  auto content = ReadFile(kStateFile);
  if (!content) return std::unexpected(std::move(content).error());

  auto state = ParseFreezerState(content.value());
  if (!state) return std::unexpected(ParseErr_(kStateFile, content.value()));
  return state.value();
}

CgExpected<bool> FreezerSubsystem::SelfFreezing() const {
  return ReadBool01_(kSelfFreezingFile);
}

CgExpected<bool> FreezerSubsystem::ParentFreezing() const {
  return ReadBool01_(kParentFreezingFile);
}

CgExpected<void> FreezerSubsystem::Freeze() {
  CGKIT_DEBUG("Freezing {}", Path());
  return Apply(
      Resources{.freezer = FreezerResources{.state = FreezerState::FROZEN}});
}

CgExpected<void> FreezerSubsystem::Thaw() {
  CGKIT_DEBUG("Thawing {}", Path());
  return Apply(
      Resources{.freezer = FreezerResources{.state = FreezerState::THAWED}});
}

}  // namespace cgkit
