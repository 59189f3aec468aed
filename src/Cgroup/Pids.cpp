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

#include "cgkit/Pids.h"

namespace cgkit {

CgExpected<void> PidsSubsystem::Apply(const Resources &resources) {
  if (!resources.pids) return {};
  const PidsResources &res = resources.pids.value();

  WriteBatch batch(this);
  if (res.max) batch.Write(kMaxFile, res.max->ToString());
  return std::move(batch).Finish();
}

CgExpected<MaxValue> PidsSubsystem::Max() const {
  return ReadMaxValue_(kMaxFile);
}

CgExpected<void> PidsSubsystem::SetMax(MaxValue max) {
  return Apply(Resources{.pids = PidsResources{.max = max}});
}

CgExpected<uint64_t> PidsSubsystem::Current() const {
  return ReadUint64_(kCurrentFile);
}

CgExpected<PidsEvents> PidsSubsystem::Events() const {
  auto kv = ReadKeyValues_(kEventsFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  auto it = kv->find("max");
  if (it == kv->end())
    return std::unexpected(ParseErr_(kEventsFile, "missing max"));
  return PidsEvents{.max = it->second};
}

}  // namespace cgkit
