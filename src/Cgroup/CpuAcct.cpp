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

#include "cgkit/CpuAcct.h"

#include <absl/strings/numbers.h>

#include "cgkit/String.h"

namespace cgkit {

CgExpected<CpuAcctStat> CpuAcctSubsystem::Stat() const {
  auto kv = ReadKeyValues_(kStatFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  const auto &m = kv.value();
  auto user = m.find("user");
  auto system = m.find("system");
  if (user == m.end() || system == m.end() || m.size() != 2)
    return std::unexpected(ParseErr_(kStatFile, "expected user and system"));

  return CpuAcctStat{.user = user->second, .system = system->second};
}

CgExpected<uint64_t> CpuAcctSubsystem::Usage() const {
  return ReadUint64_(kUsageFile);
}

CgExpected<uint64_t> CpuAcctSubsystem::UsageUser() const {
  return ReadUint64_(kUsageUserFile);
}

CgExpected<uint64_t> CpuAcctSubsystem::UsageSys() const {
  return ReadUint64_(kUsageSysFile);
}

CgExpected<std::vector<uint64_t>> CpuAcctSubsystem::UsagePerCpu() const {
  return ReadUint64List_(kUsagePerCpuFile);
}

CgExpected<std::vector<uint64_t>> CpuAcctSubsystem::UsagePerCpuUser() const {
  return ReadUint64List_(kUsagePerCpuUserFile);
}

CgExpected<std::vector<uint64_t>> CpuAcctSubsystem::UsagePerCpuSys() const {
  return ReadUint64List_(kUsagePerCpuSysFile);
}

CgExpected<std::vector<CpuAcctUsage>> CpuAcctSubsystem::UsageAll() const {
  auto content = ReadFile(kUsageAllFile);
  if (!content) return std::unexpected(std::move(content).error());

  std::vector<std::string_view> lines =
      util::SplitNonEmptyLines(content.value());

  // First line is the "cpu user system" header.
  if (lines.empty() ||
      util::SplitFields(lines[0]) !=
          std::vector<std::string_view>{"cpu", "user", "system"})
    return std::unexpected(ParseErr_(kUsageAllFile, content.value()));

  std::vector<CpuAcctUsage> usages;
  usages.reserve(lines.size() - 1);
  for (size_t i = 1; i < lines.size(); ++i) {
    std::vector<std::string_view> fields = util::SplitFields(lines[i]);
    CpuAcctUsage usage{};
    if (fields.size() != 3 || !absl::SimpleAtoi(fields[0], &usage.cpu) ||
        !absl::SimpleAtoi(fields[1], &usage.user) ||
        !absl::SimpleAtoi(fields[2], &usage.system))
      return std::unexpected(ParseErr_(kUsageAllFile, content.value()));
    usages.push_back(usage);
  }
  return usages;
}

CgExpected<void> CpuAcctSubsystem::ResetUsage() {
  return WriteFile(kUsageFile, "0");
}

}  // namespace cgkit
