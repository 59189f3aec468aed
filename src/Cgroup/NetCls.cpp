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

#include "cgkit/NetCls.h"

namespace cgkit {

CgExpected<void> NetClsSubsystem::Apply(const Resources &resources) {
  if (!resources.net_cls) return {};

  WriteBatch batch(this);
  batch.WriteIfSet(kClassIdFile, resources.net_cls->classid);
  return std::move(batch).Finish();
}

CgExpected<uint32_t> NetClsSubsystem::ClassId() const {
  auto v = ReadUint64_(kClassIdFile);
  if (!v) return std::unexpected(std::move(v).error());
  if (v.value() > UINT32_MAX)
    return std::unexpected(
        ParseErr_(kClassIdFile, fmt::format("{}", v.value())));
  return static_cast<uint32_t>(v.value());
}

CgExpected<void> NetClsSubsystem::SetClassId(uint32_t classid) {
  return Apply(Resources{.net_cls = NetClsResources{.classid = classid}});
}

}  // namespace cgkit
