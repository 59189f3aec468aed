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

#include "cgkit/Devices.h"

#include "cgkit/String.h"

namespace cgkit {

namespace {

std::vector<std::string> FormatRules(const std::vector<DeviceRule> &rules) {
  std::vector<std::string> lines;
  lines.reserve(rules.size());
  for (const auto &rule : rules) lines.emplace_back(rule.ToString());
  return lines;
}

}  // namespace

CgExpected<void> DevicesSubsystem::Validate(const DevicesResources &res) {
  for (const auto *rules : {&res.deny, &res.allow}) {
    if (!rules->has_value()) continue;
    for (const auto &rule : rules->value()) {
      if (rule.access.Empty())
        return std::unexpected(
            FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                        "Device rule '{}' grants no access", rule.ToString()));
    }
  }
  return {};
}

CgExpected<void> DevicesSubsystem::Apply(const Resources &resources) {
  if (!resources.devices) return {};
  const DevicesResources &res = resources.devices.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.deny) batch.WriteLines(kDenyFile, FormatRules(res.deny.value()));
  if (res.allow) batch.WriteLines(kAllowFile, FormatRules(res.allow.value()));
  return std::move(batch).Finish();
}

CgExpected<std::vector<DeviceRule>> DevicesSubsystem::List() const {
  auto content = ReadFile(kListFile);
  if (!content) return std::unexpected(std::move(content).error());

  std::vector<DeviceRule> rules;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    auto rule = DeviceRule::Parse(line);
    if (!rule) return std::unexpected(ParseErr_(kListFile, content.value()));
    rules.emplace_back(std::move(rule).value());
  }
  return rules;
}

CgExpected<void> DevicesSubsystem::Allow(const std::vector<DeviceRule> &rules) {
  return Apply(Resources{.devices = DevicesResources{.allow = rules}});
}

CgExpected<void> DevicesSubsystem::Deny(const std::vector<DeviceRule> &rules) {
  return Apply(Resources{.devices = DevicesResources{.deny = rules}});
}

}  // namespace cgkit
