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

#include "cgkit/Memory.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

#include <utility>

#include "cgkit/String.h"

namespace cgkit {

namespace {

constexpr std::pair<std::string_view, uint64_t MemoryStat::*> kStatFields[] = {
    {"cache", &MemoryStat::cache},
    {"rss", &MemoryStat::rss},
    {"rss_huge", &MemoryStat::rss_huge},
    {"shmem", &MemoryStat::shmem},
    {"mapped_file", &MemoryStat::mapped_file},
    {"dirty", &MemoryStat::dirty},
    {"writeback", &MemoryStat::writeback},
    {"pgpgin", &MemoryStat::pgpgin},
    {"pgpgout", &MemoryStat::pgpgout},
    {"pgfault", &MemoryStat::pgfault},
    {"pgmajfault", &MemoryStat::pgmajfault},
    {"active_anon", &MemoryStat::active_anon},
    {"inactive_anon", &MemoryStat::inactive_anon},
    {"active_file", &MemoryStat::active_file},
    {"inactive_file", &MemoryStat::inactive_file},
    {"unevictable", &MemoryStat::unevictable},
    {"hierarchical_memory_limit", &MemoryStat::hierarchical_memory_limit},
    {"total_cache", &MemoryStat::total_cache},
    {"total_rss", &MemoryStat::total_rss},
    {"total_rss_huge", &MemoryStat::total_rss_huge},
    {"total_shmem", &MemoryStat::total_shmem},
    {"total_mapped_file", &MemoryStat::total_mapped_file},
    {"total_dirty", &MemoryStat::total_dirty},
    {"total_writeback", &MemoryStat::total_writeback},
    {"total_pgpgin", &MemoryStat::total_pgpgin},
    {"total_pgpgout", &MemoryStat::total_pgpgout},
    {"total_pgfault", &MemoryStat::total_pgfault},
    {"total_pgmajfault", &MemoryStat::total_pgmajfault},
    {"total_active_anon", &MemoryStat::total_active_anon},
    {"total_inactive_anon", &MemoryStat::total_inactive_anon},
    {"total_active_file", &MemoryStat::total_active_file},
    {"total_inactive_file", &MemoryStat::total_inactive_file},
    {"total_unevictable", &MemoryStat::total_unevictable},
};

constexpr std::pair<std::string_view, std::optional<uint64_t> MemoryStat::*>
    kOptionalStatFields[] = {
        {"swap", &MemoryStat::swap},
        {"total_swap", &MemoryStat::total_swap},
        {"hierarchical_memsw_limit", &MemoryStat::hierarchical_memsw_limit},
};

// "total=5 N0=3 N1=2"
bool ParseNumaLine(std::string_view line, std::string *key,
                   NumaStatEntry *entry) {
  std::vector<std::string_view> fields = util::SplitFields(line);
  if (fields.empty()) return false;

  entry->nodes.clear();
  for (size_t i = 0; i < fields.size(); ++i) {
    std::pair<std::string_view, std::string_view> kv =
        absl::StrSplit(fields[i], absl::MaxSplits('=', 1));
    uint64_t v;
    if (kv.first.empty() || !absl::SimpleAtoi(kv.second, &v)) return false;

    if (i == 0) {
      *key = std::string(kv.first);
      entry->total = v;
    } else {
      if (kv.first.front() != 'N') return false;
      entry->nodes.push_back(v);
    }
  }
  return true;
}

}  // namespace

CgExpected<void> MemorySubsystem::Validate(const MemoryResources &res) {
  using Limit = std::pair<std::string_view, const std::optional<int64_t> *>;
  const Limit limits[] = {
      {kLimitFile, &res.limit_in_bytes},
      {kMemswLimitFile, &res.memsw_limit_in_bytes},
      {kKmemLimitFile, &res.kmem_limit_in_bytes},
      {kKmemTcpLimitFile, &res.kmem_tcp_limit_in_bytes},
      {kSoftLimitFile, &res.soft_limit_in_bytes},
  };

  for (const auto &[file, limit] : limits) {
    if (limit->has_value() && limit->value() < kUnlimited)
      return std::unexpected(
          FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                      "{} must be -1 or non-negative, got {}", file,
                      limit->value()));
  }

  if (res.swappiness && res.swappiness.value() > kMaxSwappiness)
    return std::unexpected(
        FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                    "swappiness {} is greater than {}", res.swappiness.value(),
                    kMaxSwappiness));

  return {};
}

CgExpected<void> MemorySubsystem::Apply(const Resources &resources) {
  if (!resources.memory) return {};
  const MemoryResources &res = resources.memory.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  bool sets_limit = res.limit_in_bytes || res.memsw_limit_in_bytes ||
                    res.kmem_limit_in_bytes || res.kmem_tcp_limit_in_bytes ||
                    res.soft_limit_in_bytes;
  if (sets_limit && IsRoot()) {
    CGKIT_WARN("Refused to set memory limits on the root of {}", Path());
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_OPERATION,
        "Memory limits cannot be set on the root of the hierarchy"));
  }

  WriteBatch batch(this);
  batch.WriteIfSet(kLimitFile, res.limit_in_bytes);
  batch.WriteIfSet(kMemswLimitFile, res.memsw_limit_in_bytes);
  batch.WriteIfSet(kKmemLimitFile, res.kmem_limit_in_bytes);
  batch.WriteIfSet(kKmemTcpLimitFile, res.kmem_tcp_limit_in_bytes);
  batch.WriteIfSet(kSoftLimitFile, res.soft_limit_in_bytes);
  batch.WriteIfSet(kSwappinessFile, res.swappiness);
  batch.WriteIfSet(kMoveChargeFile, res.move_charge_at_immigrate);
  batch.WriteIfSet(kUseHierarchyFile, res.use_hierarchy);
  batch.WriteIfSet(kOomControlFile, res.oom_kill_disable);
  return std::move(batch).Finish();
}

CgExpected<MemoryStat> MemorySubsystem::Stat() const {
  auto kv = ReadKeyValues_(kStatFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  MemoryStat stat;
  stat.raw = std::move(kv).value();

  for (const auto &[key, field] : kStatFields) {
    auto it = stat.raw.find(std::string(key));
    if (it != stat.raw.end()) stat.*field = it->second;
  }
  for (const auto &[key, field] : kOptionalStatFields) {
    auto it = stat.raw.find(std::string(key));
    if (it != stat.raw.end()) stat.*field = it->second;
  }

  return stat;
}

CgExpected<NumaStat> MemorySubsystem::GetNumaStat() const {
  auto content = ReadFile(kNumaStatFile);
  if (!content) return std::unexpected(std::move(content).error());

  std::map<std::string, NumaStatEntry> entries;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::string key;
    NumaStatEntry entry;
    if (!ParseNumaLine(line, &key, &entry) ||
        !entries.emplace(std::move(key), std::move(entry)).second)
      return std::unexpected(ParseErr_(kNumaStatFile, content.value()));
  }

  auto take = [&entries](const std::string &key) {
    std::optional<NumaStatEntry> e;
    if (auto it = entries.find(key); it != entries.end()) e = it->second;
    return e;
  };

  auto total = take("total");
  auto file = take("file");
  auto anon = take("anon");
  auto unevictable = take("unevictable");
  if (!total || !file || !anon || !unevictable)
    return std::unexpected(ParseErr_(kNumaStatFile, content.value()));

  return NumaStat{
      .total = std::move(total).value(),
      .file = std::move(file).value(),
      .anon = std::move(anon).value(),
      .unevictable = std::move(unevictable).value(),
      .hierarchical_total = take("hierarchical_total"),
      .hierarchical_file = take("hierarchical_file"),
      .hierarchical_anon = take("hierarchical_anon"),
      .hierarchical_unevictable = take("hierarchical_unevictable"),
  };
}

CgExpected<OomControl> MemorySubsystem::GetOomControl() const {
  auto kv = ReadKeyValues_(kOomControlFile);
  if (!kv) return std::unexpected(std::move(kv).error());

  const auto &m = kv.value();
  auto disable = m.find("oom_kill_disable");
  auto under = m.find("under_oom");
  if (disable == m.end() || under == m.end() || disable->second > 1 ||
      under->second > 1)
    return std::unexpected(
        ParseErr_(kOomControlFile, "expected oom_kill_disable and under_oom"));

  OomControl oom{.oom_kill_disable = disable->second == 1,
                 .under_oom = under->second == 1,
                 .oom_kill = std::nullopt};
  if (auto kill = m.find("oom_kill"); kill != m.end())
    oom.oom_kill = kill->second;
  return oom;
}

CgExpected<uint64_t> MemorySubsystem::UsageInBytes() const {
  return ReadUint64_(kUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::MaxUsageInBytes() const {
  return ReadUint64_(kMaxUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::LimitInBytes() const {
  return ReadUint64_(kLimitFile);
}

CgExpected<uint64_t> MemorySubsystem::Failcnt() const {
  return ReadUint64_(kFailcntFile);
}

CgExpected<void> MemorySubsystem::SetLimitInBytes(int64_t limit) {
  return Apply(Resources{.memory = MemoryResources{.limit_in_bytes = limit}});
}

CgExpected<uint64_t> MemorySubsystem::MemswUsageInBytes() const {
  return ReadUint64_(kMemswUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::MemswMaxUsageInBytes() const {
  return ReadUint64_(kMemswMaxUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::MemswLimitInBytes() const {
  return ReadUint64_(kMemswLimitFile);
}

CgExpected<uint64_t> MemorySubsystem::MemswFailcnt() const {
  return ReadUint64_(kMemswFailcntFile);
}

CgExpected<void> MemorySubsystem::SetMemswLimitInBytes(int64_t limit) {
  return Apply(
      Resources{.memory = MemoryResources{.memsw_limit_in_bytes = limit}});
}

CgExpected<uint64_t> MemorySubsystem::KmemUsageInBytes() const {
  return ReadUint64_(kKmemUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemMaxUsageInBytes() const {
  return ReadUint64_(kKmemMaxUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemLimitInBytes() const {
  return ReadUint64_(kKmemLimitFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemFailcnt() const {
  return ReadUint64_(kKmemFailcntFile);
}

CgExpected<void> MemorySubsystem::SetKmemLimitInBytes(int64_t limit) {
  return Apply(
      Resources{.memory = MemoryResources{.kmem_limit_in_bytes = limit}});
}

CgExpected<uint64_t> MemorySubsystem::KmemTcpUsageInBytes() const {
  return ReadUint64_(kKmemTcpUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemTcpMaxUsageInBytes() const {
  return ReadUint64_(kKmemTcpMaxUsageFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemTcpLimitInBytes() const {
  return ReadUint64_(kKmemTcpLimitFile);
}

CgExpected<uint64_t> MemorySubsystem::KmemTcpFailcnt() const {
  return ReadUint64_(kKmemTcpFailcntFile);
}

CgExpected<void> MemorySubsystem::SetKmemTcpLimitInBytes(int64_t limit) {
  return Apply(
      Resources{.memory = MemoryResources{.kmem_tcp_limit_in_bytes = limit}});
}

CgExpected<uint64_t> MemorySubsystem::SoftLimitInBytes() const {
  return ReadUint64_(kSoftLimitFile);
}

CgExpected<void> MemorySubsystem::SetSoftLimitInBytes(int64_t limit) {
  return Apply(
      Resources{.memory = MemoryResources{.soft_limit_in_bytes = limit}});
}

CgExpected<uint64_t> MemorySubsystem::Swappiness() const {
  return ReadUint64_(kSwappinessFile);
}

CgExpected<void> MemorySubsystem::SetSwappiness(uint64_t swappiness) {
  return Apply(Resources{.memory = MemoryResources{.swappiness = swappiness}});
}

CgExpected<bool> MemorySubsystem::UseHierarchy() const {
  return ReadBool01_(kUseHierarchyFile);
}

CgExpected<void> MemorySubsystem::SetUseHierarchy(bool enable) {
  return Apply(Resources{.memory = MemoryResources{.use_hierarchy = enable}});
}

CgExpected<bool> MemorySubsystem::MoveChargeAtImmigrate() const {
  // The kernel file is a bitmask, any set bit moves charges.
  auto v = ReadUint64_(kMoveChargeFile);
  if (!v) return std::unexpected(std::move(v).error());
  return v.value() != 0;
}

CgExpected<void> MemorySubsystem::SetMoveChargeAtImmigrate(bool enable) {
  return Apply(Resources{
      .memory = MemoryResources{.move_charge_at_immigrate = enable}});
}

CgExpected<void> MemorySubsystem::DisableOomKiller(bool disable) {
  return Apply(
      Resources{.memory = MemoryResources{.oom_kill_disable = disable}});
}

CgExpected<void> MemorySubsystem::ForceEmpty() {
  return WriteFile(kForceEmptyFile, "0");
}

}  // namespace cgkit
