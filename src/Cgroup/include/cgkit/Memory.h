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

/**
 * memory.stat. Keys a kernel does not report read as 0, the swap and memsw
 * fields stay empty when swap accounting is off. Every key the kernel
 * reported is also kept in `raw`.
 */
struct MemoryStat {
  uint64_t cache{};
  uint64_t rss{};
  uint64_t rss_huge{};
  uint64_t shmem{};
  uint64_t mapped_file{};
  uint64_t dirty{};
  uint64_t writeback{};
  std::optional<uint64_t> swap;
  uint64_t pgpgin{};
  uint64_t pgpgout{};
  uint64_t pgfault{};
  uint64_t pgmajfault{};
  uint64_t active_anon{};
  uint64_t inactive_anon{};
  uint64_t active_file{};
  uint64_t inactive_file{};
  uint64_t unevictable{};
  uint64_t hierarchical_memory_limit{};
  std::optional<uint64_t> hierarchical_memsw_limit;

  uint64_t total_cache{};
  uint64_t total_rss{};
  uint64_t total_rss_huge{};
  uint64_t total_shmem{};
  uint64_t total_mapped_file{};
  uint64_t total_dirty{};
  uint64_t total_writeback{};
  std::optional<uint64_t> total_swap;
  uint64_t total_pgpgin{};
  uint64_t total_pgpgout{};
  uint64_t total_pgfault{};
  uint64_t total_pgmajfault{};
  uint64_t total_active_anon{};
  uint64_t total_inactive_anon{};
  uint64_t total_active_file{};
  uint64_t total_inactive_file{};
  uint64_t total_unevictable{};

  std::map<std::string, uint64_t> raw;
};

// Page counts, in total and per NUMA node.
struct NumaStatEntry {
  uint64_t total{};
  std::vector<uint64_t> nodes;

  bool operator==(const NumaStatEntry &rhs) const = default;
};

struct NumaStat {
  NumaStatEntry total;
  NumaStatEntry file;
  NumaStatEntry anon;
  NumaStatEntry unevictable;

  std::optional<NumaStatEntry> hierarchical_total;
  std::optional<NumaStatEntry> hierarchical_file;
  std::optional<NumaStatEntry> hierarchical_anon;
  std::optional<NumaStatEntry> hierarchical_unevictable;
};

struct OomControl {
  bool oom_kill_disable;
  bool under_oom;
  // Absent before Linux 4.13.
  std::optional<uint64_t> oom_kill;
};

class MemorySubsystem : public SubsystemOf<SubsystemKind::MEMORY> {
 public:
  static constexpr std::string_view kStatFile = "memory.stat";
  static constexpr std::string_view kNumaStatFile = "memory.numa_stat";
  static constexpr std::string_view kOomControlFile = "memory.oom_control";
  static constexpr std::string_view kForceEmptyFile = "memory.force_empty";
  static constexpr std::string_view kSwappinessFile = "memory.swappiness";
  static constexpr std::string_view kUseHierarchyFile =
      "memory.use_hierarchy";
  static constexpr std::string_view kMoveChargeFile =
      "memory.move_charge_at_immigrate";
  static constexpr std::string_view kSoftLimitFile =
      "memory.soft_limit_in_bytes";

  static constexpr std::string_view kLimitFile = "memory.limit_in_bytes";
  static constexpr std::string_view kUsageFile = "memory.usage_in_bytes";
  static constexpr std::string_view kMaxUsageFile =
      "memory.max_usage_in_bytes";
  static constexpr std::string_view kFailcntFile = "memory.failcnt";

  static constexpr std::string_view kMemswLimitFile =
      "memory.memsw.limit_in_bytes";
  static constexpr std::string_view kMemswUsageFile =
      "memory.memsw.usage_in_bytes";
  static constexpr std::string_view kMemswMaxUsageFile =
      "memory.memsw.max_usage_in_bytes";
  static constexpr std::string_view kMemswFailcntFile = "memory.memsw.failcnt";

  static constexpr std::string_view kKmemLimitFile =
      "memory.kmem.limit_in_bytes";
  static constexpr std::string_view kKmemUsageFile =
      "memory.kmem.usage_in_bytes";
  static constexpr std::string_view kKmemMaxUsageFile =
      "memory.kmem.max_usage_in_bytes";
  static constexpr std::string_view kKmemFailcntFile = "memory.kmem.failcnt";

  static constexpr std::string_view kKmemTcpLimitFile =
      "memory.kmem.tcp.limit_in_bytes";
  static constexpr std::string_view kKmemTcpUsageFile =
      "memory.kmem.tcp.usage_in_bytes";
  static constexpr std::string_view kKmemTcpMaxUsageFile =
      "memory.kmem.tcp.max_usage_in_bytes";
  static constexpr std::string_view kKmemTcpFailcntFile =
      "memory.kmem.tcp.failcnt";

  static constexpr uint64_t kMaxSwappiness = 100;

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const MemoryResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.memory.has_value();
  }

  /**
   * limit_in_bytes is written before memsw.limit_in_bytes. Raising both
   * above the current memsw limit in one call therefore fails with EINVAL
   * on the first write; apply the memsw limit separately first.
   * Limits are rejected with INVALID_OPERATION on the hierarchy root.
   */
  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<MemoryStat> Stat() const;
  CgExpected<NumaStat> GetNumaStat() const;
  CgExpected<OomControl> GetOomControl() const;

  CgExpected<uint64_t> UsageInBytes() const;
  CgExpected<uint64_t> MaxUsageInBytes() const;
  CgExpected<uint64_t> LimitInBytes() const;
  CgExpected<uint64_t> Failcnt() const;
  CgExpected<void> SetLimitInBytes(int64_t limit);

  CgExpected<uint64_t> MemswUsageInBytes() const;
  CgExpected<uint64_t> MemswMaxUsageInBytes() const;
  CgExpected<uint64_t> MemswLimitInBytes() const;
  CgExpected<uint64_t> MemswFailcnt() const;
  CgExpected<void> SetMemswLimitInBytes(int64_t limit);

  CgExpected<uint64_t> KmemUsageInBytes() const;
  CgExpected<uint64_t> KmemMaxUsageInBytes() const;
  CgExpected<uint64_t> KmemLimitInBytes() const;
  CgExpected<uint64_t> KmemFailcnt() const;
  CgExpected<void> SetKmemLimitInBytes(int64_t limit);

  CgExpected<uint64_t> KmemTcpUsageInBytes() const;
  CgExpected<uint64_t> KmemTcpMaxUsageInBytes() const;
  CgExpected<uint64_t> KmemTcpLimitInBytes() const;
  CgExpected<uint64_t> KmemTcpFailcnt() const;
  CgExpected<void> SetKmemTcpLimitInBytes(int64_t limit);

  CgExpected<uint64_t> SoftLimitInBytes() const;
  CgExpected<void> SetSoftLimitInBytes(int64_t limit);

  CgExpected<uint64_t> Swappiness() const;
  CgExpected<void> SetSwappiness(uint64_t swappiness);

  CgExpected<bool> UseHierarchy() const;
  CgExpected<void> SetUseHierarchy(bool enable);

  CgExpected<bool> MoveChargeAtImmigrate() const;
  CgExpected<void> SetMoveChargeAtImmigrate(bool enable);

  CgExpected<void> DisableOomKiller(bool disable);

  // Reclaims as much memory as possible. Fails with EBUSY while tasks are
  // attached.
  CgExpected<void> ForceEmpty();
};

}  // namespace cgkit
