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

#include "cgkit/Resources.h"

#include <absl/strings/ascii.h>

#include <algorithm>
#include <utility>

#include "cgkit/String.h"

namespace cgkit {

std::optional<MaxValue> MaxValue::Parse(std::string_view s) {
  s = absl::StripAsciiWhitespace(s);
  if (s == "max") return Max();

  uint64_t v;
  if (!util::ConvertStringToUint64(s, &v)) return std::nullopt;
  return Of(v);
}

std::string MaxValue::ToString() const {
  if (IsMax()) return "max";
  return fmt::format("{}", m_value_.value());
}

std::string HugeTlbLimit::ToFileValue(HugepageSize size) const {
  switch (m_unit_) {
  case Unit::BYTES:
    return fmt::format("{}", m_amount_);
  case Unit::PAGES:
    return fmt::format("{}", m_amount_ * HugepageBytes(size));
  case Unit::UNLIMITED:
    return fmt::format("{}", kUnlimited);
  }
  std::unreachable();
}

DeviceAccess::DeviceAccess(std::initializer_list<DevicePermission> perms) {
  for (DevicePermission p : perms) Add(p);
}

std::optional<DeviceAccess> DeviceAccess::Parse(std::string_view s) {
  DeviceAccess access;
  for (char c : s) {
    DevicePermission perm;
    switch (c) {
    case 'r':
      perm = DevicePermission::READ;
      break;
    case 'w':
      perm = DevicePermission::WRITE;
      break;
    case 'm':
      perm = DevicePermission::MKNOD;
      break;
    default:
      return std::nullopt;
    }
    if (access.Contains(perm)) return std::nullopt;
    access.Add(perm);
  }
  if (access.Empty()) return std::nullopt;
  return access;
}

void DeviceAccess::Add(DevicePermission perm) {
  if (!Contains(perm)) m_perms_.push_back(perm);
}

bool DeviceAccess::Contains(DevicePermission perm) const {
  return std::ranges::find(m_perms_, perm) != m_perms_.end();
}

std::string DeviceAccess::ToString() const {
  std::string s;
  for (DevicePermission p : m_perms_) {
    switch (p) {
    case DevicePermission::READ:
      s += 'r';
      break;
    case DevicePermission::WRITE:
      s += 'w';
      break;
    case DevicePermission::MKNOD:
      s += 'm';
      break;
    }
  }
  return s;
}

bool DeviceAccess::operator==(const DeviceAccess &rhs) const {
  if (m_perms_.size() != rhs.m_perms_.size()) return false;
  return std::ranges::all_of(
      m_perms_, [&rhs](DevicePermission p) { return rhs.Contains(p); });
}

CgExpected<DeviceRule> DeviceRule::Parse(std::string_view s) {
  auto invalid = [s]() {
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "Invalid device rule '{}'", s));
  };

  std::vector<std::string_view> fields = util::SplitFields(s);
  if (fields.empty() || fields[0].size() != 1) return invalid();

  DeviceRule rule;
  switch (fields[0][0]) {
  case 'a':
    rule.type = DeviceType::ALL;
    break;
  case 'c':
    rule.type = DeviceType::CHAR;
    break;
  case 'b':
    rule.type = DeviceType::BLOCK;
    break;
  default:
    return invalid();
  }

  if (fields.size() == 1) {
    if (rule.type != DeviceType::ALL) return invalid();
    rule.access = DeviceAccess::All();
    return rule;
  }

  if (fields.size() != 3) return invalid();

  if (!util::ParseMajorMinor(fields[1], true, &rule.major, &rule.minor))
    return invalid();

  auto access = DeviceAccess::Parse(fields[2]);
  if (!access) return invalid();
  rule.access = std::move(access).value();

  return rule;
}

std::string DeviceRule::ToString() const {
  char type_char;
  switch (type) {
  case DeviceType::ALL:
    type_char = 'a';
    break;
  case DeviceType::CHAR:
    type_char = 'c';
    break;
  case DeviceType::BLOCK:
    type_char = 'b';
    break;
  default:
    std::unreachable();
  }

  auto num = [](const std::optional<uint64_t> &n) {
    return n ? fmt::format("{}", n.value()) : std::string("*");
  };

  return fmt::format("{} {}:{} {}", type_char, num(major), num(minor),
                     access.ToString());
}

std::string_view FreezerStateStr(FreezerState state) {
  switch (state) {
  case FreezerState::THAWED:
    return "THAWED";
  case FreezerState::FREEZING:
    return "FREEZING";
  case FreezerState::FROZEN:
    return "FROZEN";
  }
  std::unreachable();
}

std::optional<FreezerState> ParseFreezerState(std::string_view s) {
  s = absl::StripAsciiWhitespace(s);
  if (s == "THAWED") return FreezerState::THAWED;
  if (s == "FREEZING") return FreezerState::FREEZING;
  if (s == "FROZEN") return FreezerState::FROZEN;
  return std::nullopt;
}

}  // namespace cgkit
