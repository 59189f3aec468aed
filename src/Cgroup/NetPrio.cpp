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

#include "cgkit/NetPrio.h"

#include <net/if.h>

#include <algorithm>

namespace cgkit {

CgExpected<void> NetPrioSubsystem::Validate(const NetPrioResources &res) {
  if (!res.ifpriomap) return {};

  for (const auto &[iface, prio] : res.ifpriomap.value()) {
    bool valid = !iface.empty() && iface.size() < IFNAMSIZ &&
                 std::ranges::none_of(iface, [](char c) {
                   return c == ' ' || c == '\t' || c == '\n' || c == '/';
                 });
    if (!valid)
      return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                         "Invalid interface name '{}'", iface));
  }
  return {};
}

CgExpected<void> NetPrioSubsystem::Apply(const Resources &resources) {
  if (!resources.net_prio) return {};
  const NetPrioResources &res = resources.net_prio.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.ifpriomap) {
    std::vector<std::string> lines;
    for (const auto &[iface, prio] : res.ifpriomap.value())
      lines.emplace_back(fmt::format("{} {}", iface, prio));
    batch.WriteLines(kIfPrioMapFile, lines);
  }
  return std::move(batch).Finish();
}

CgExpected<uint32_t> NetPrioSubsystem::PrioIdx() const {
  auto v = ReadUint64_(kPrioIdxFile);
  if (!v) return std::unexpected(std::move(v).error());
  if (v.value() > UINT32_MAX)
    return std::unexpected(
        ParseErr_(kPrioIdxFile, fmt::format("{}", v.value())));
  return static_cast<uint32_t>(v.value());
}

CgExpected<std::map<std::string, uint32_t>> NetPrioSubsystem::IfPrioMap()
    const {
  auto kv = ReadKeyValues_(kIfPrioMapFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  std::map<std::string, uint32_t> prios;
  for (const auto &[iface, prio] : kv.value()) {
    if (prio > UINT32_MAX)
      return std::unexpected(ParseErr_(kIfPrioMapFile, iface));
    prios.emplace(iface, static_cast<uint32_t>(prio));
  }
  return prios;
}

CgExpected<void> NetPrioSubsystem::SetIfPrio(const std::string &iface,
                                             uint32_t prio) {
  return Apply(Resources{
      .net_prio = NetPrioResources{
          .ifpriomap = std::map<std::string, uint32_t>{{iface, prio}}}});
}

}  // namespace cgkit
