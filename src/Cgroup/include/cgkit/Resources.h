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

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cgkit/CgroupError.h"
#include "cgkit/CgroupPublicDefs.h"

namespace cgkit {

// Written as "-1" to the files that take a signed limit.
inline constexpr int64_t kUnlimited = -1;

/**
 * A number or the literal "max", as used by pids.max and rdma.max.
 */
class MaxValue {
 public:
  static constexpr MaxValue Max() { return MaxValue(); }
  static constexpr MaxValue Of(uint64_t value) { return MaxValue(value); }

  static std::optional<MaxValue> Parse(std::string_view s);

  bool IsMax() const { return !m_value_.has_value(); }
  uint64_t Value() const { return m_value_.value(); }

  std::string ToString() const;

  bool operator==(const MaxValue &rhs) const = default;

 private:
  constexpr MaxValue() = default;
  constexpr explicit MaxValue(uint64_t value) : m_value_(value) {}

  std::optional<uint64_t> m_value_;
};

/* --------------------------- cpu --------------------------- */

struct CpuResources {
  std::optional<uint64_t> shares;
  std::optional<uint64_t> cfs_period_us;
  // kUnlimited removes the quota.
  std::optional<int64_t> cfs_quota_us;
  std::optional<uint64_t> rt_period_us;
  // kUnlimited removes the restriction.
  std::optional<int64_t> rt_runtime_us;
};

/* -------------------------- cpuset ------------------------- */

struct CpuSetResources {
  std::optional<std::set<uint32_t>> cpus;
  std::optional<std::set<uint32_t>> mems;
  std::optional<bool> memory_migrate;
  std::optional<bool> cpu_exclusive;
  std::optional<bool> mem_exclusive;
  std::optional<bool> mem_hardwall;
  std::optional<bool> memory_spread_page;
  std::optional<bool> memory_spread_slab;
  std::optional<bool> sched_load_balance;
  // -1 (system default) to 5.
  std::optional<int32_t> sched_relax_domain_level;
};

/* -------------------------- memory ------------------------- */

struct MemoryResources {
  // Each limit takes kUnlimited.
  std::optional<int64_t> limit_in_bytes;
  std::optional<int64_t> memsw_limit_in_bytes;
  std::optional<int64_t> kmem_limit_in_bytes;
  std::optional<int64_t> kmem_tcp_limit_in_bytes;
  std::optional<int64_t> soft_limit_in_bytes;
  // 0 to 100.
  std::optional<uint64_t> swappiness;
  std::optional<bool> move_charge_at_immigrate;
  std::optional<bool> use_hierarchy;
  std::optional<bool> oom_kill_disable;
};

/* -------------------------- hugetlb ------------------------ */

enum class HugepageSize : uint8_t {
  MB_2 = 0,
  GB_1,
};

inline constexpr uint64_t kHugepage2MbBytes = 2ULL << 20;
inline constexpr uint64_t kHugepage1GbBytes = 1ULL << 30;

constexpr std::string_view HugepageSizeStr(HugepageSize size) {
  return size == HugepageSize::MB_2 ? "2MB" : "1GB";
}

constexpr uint64_t HugepageBytes(HugepageSize size) {
  return size == HugepageSize::MB_2 ? kHugepage2MbBytes : kHugepage1GbBytes;
}

class HugeTlbLimit {
 public:
  enum class Unit : uint8_t { BYTES, PAGES, UNLIMITED };

  static constexpr HugeTlbLimit Bytes(uint64_t n) {
    return HugeTlbLimit(Unit::BYTES, n);
  }
  static constexpr HugeTlbLimit Pages(uint64_t n) {
    return HugeTlbLimit(Unit::PAGES, n);
  }
  static constexpr HugeTlbLimit Unlimited() {
    return HugeTlbLimit(Unit::UNLIMITED, 0);
  }

  Unit GetUnit() const { return m_unit_; }
  uint64_t Amount() const { return m_amount_; }

  // Value written to hugetlb.<size>.limit_in_bytes.
  std::string ToFileValue(HugepageSize size) const;

  bool operator==(const HugeTlbLimit &rhs) const = default;

 private:
  constexpr HugeTlbLimit(Unit unit, uint64_t amount)
      : m_unit_(unit), m_amount_(amount) {}

  Unit m_unit_;
  uint64_t m_amount_;
};

struct HugeTlbResources {
  std::optional<HugeTlbLimit> limit_2mb;
  std::optional<HugeTlbLimit> limit_1gb;
};

/* -------------------------- devices ------------------------ */

enum class DeviceType : uint8_t {
  ALL = 0,  // 'a'
  CHAR,     // 'c'
  BLOCK,    // 'b'
};

enum class DevicePermission : uint8_t {
  READ = 0,  // 'r'
  WRITE,     // 'w'
  MKNOD,     // 'm'
};

/**
 * A set of device permissions that remembers the order it was written in,
 * so "mr" parses and formats back as "mr". Equality ignores order.
 */
class DeviceAccess {
 public:
  DeviceAccess() = default;
  DeviceAccess(std::initializer_list<DevicePermission> perms);

  static std::optional<DeviceAccess> Parse(std::string_view s);
  static DeviceAccess All() {
    return {DevicePermission::READ, DevicePermission::WRITE,
            DevicePermission::MKNOD};
  }

  void Add(DevicePermission perm);
  bool Contains(DevicePermission perm) const;
  bool Empty() const { return m_perms_.empty(); }

  std::string ToString() const;

  bool operator==(const DeviceAccess &rhs) const;

 private:
  std::vector<DevicePermission> m_perms_;
};

/**
 * One line of devices.allow / devices.deny / devices.list:
 * "type major:minor access". std::nullopt major or minor is '*'.
 */
struct DeviceRule {
  DeviceType type{DeviceType::ALL};
  std::optional<uint64_t> major;
  std::optional<uint64_t> minor;
  DeviceAccess access;

  // Accepts the short form "a" as "a *:* rwm".
  static CgExpected<DeviceRule> Parse(std::string_view s);

  std::string ToString() const;

  bool operator==(const DeviceRule &rhs) const = default;
};

struct DevicesResources {
  // deny is written before allow.
  std::optional<std::vector<DeviceRule>> deny;
  std::optional<std::vector<DeviceRule>> allow;
};

/* --------------------------- blkio ------------------------- */

struct DeviceNumber {
  uint64_t major;
  uint64_t minor;

  auto operator<=>(const DeviceNumber &) const = default;
};

struct BlkIoResources {
  // 10 to 1000.
  std::optional<uint16_t> weight;
  std::optional<std::map<DeviceNumber, uint16_t>> weight_device;
  std::optional<uint16_t> leaf_weight;
  std::optional<std::map<DeviceNumber, uint16_t>> leaf_weight_device;
  std::optional<std::map<DeviceNumber, uint64_t>> read_bps_device;
  std::optional<std::map<DeviceNumber, uint64_t>> write_bps_device;
  std::optional<std::map<DeviceNumber, uint64_t>> read_iops_device;
  std::optional<std::map<DeviceNumber, uint64_t>> write_iops_device;
};

/* --------------------------- rdma -------------------------- */

struct RdmaLimit {
  std::optional<MaxValue> hca_handle;
  std::optional<MaxValue> hca_object;

  bool operator==(const RdmaLimit &rhs) const = default;
};

struct RdmaResources {
  std::optional<std::map<std::string, RdmaLimit>> max;
};

/* -------------------------- net_cls ------------------------ */

// 0xAAAABBBB where AAAA is the major and BBBB the minor tc handle.
constexpr uint32_t MakeClassId(uint16_t major, uint16_t minor) {
  return (static_cast<uint32_t>(major) << 16) | minor;
}

struct NetClsResources {
  std::optional<uint32_t> classid;
};

/* ------------------------- net_prio ------------------------ */

struct NetPrioResources {
  std::optional<std::map<std::string, uint32_t>> ifpriomap;
};

/* --------------------------- pids -------------------------- */

struct PidsResources {
  std::optional<MaxValue> max;
};

/* -------------------------- freezer ------------------------ */

enum class FreezerState : uint8_t {
  THAWED = 0,
  FREEZING,
  FROZEN,
};

std::string_view FreezerStateStr(FreezerState state);
std::optional<FreezerState> ParseFreezerState(std::string_view s);

struct FreezerResources {
  // FREEZING is read-only and rejected.
  std::optional<FreezerState> state;
};

/* ----------------------------------------------------------- */

/**
 * One optional record per configurable controller. cpuacct and perf_event
 * have nothing to configure.
 */
struct Resources {
  std::optional<CpuResources> cpu;
  std::optional<CpuSetResources> cpuset;
  std::optional<MemoryResources> memory;
  std::optional<HugeTlbResources> hugetlb;
  std::optional<DevicesResources> devices;
  std::optional<BlkIoResources> blkio;
  std::optional<RdmaResources> rdma;
  std::optional<NetClsResources> net_cls;
  std::optional<NetPrioResources> net_prio;
  std::optional<PidsResources> pids;
  std::optional<FreezerResources> freezer;
};

}  // namespace cgkit

namespace fmt {

template <>
struct formatter<cgkit::DeviceNumber> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const cgkit::DeviceNumber &v, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}:{}", v.major, v.minor);
  }
};

}  // namespace fmt
