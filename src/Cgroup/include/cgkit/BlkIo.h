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

// One "major:minor Op value" line of an io stat file.
struct BlkIoStatEntry {
  DeviceNumber device;
  // Read, Write, Sync, Async, Discard or Total.
  std::string op;
  uint64_t value;

  bool operator==(const BlkIoStatEntry &rhs) const = default;
};

struct BlkIoStat {
  std::vector<BlkIoStatEntry> entries;
  // The trailing "Total n" line.
  uint64_t total{};
};

class BlkIoSubsystem : public SubsystemOf<SubsystemKind::BLKIO> {
 public:
  static constexpr std::string_view kWeightFile = "blkio.weight";
  static constexpr std::string_view kWeightDeviceFile = "blkio.weight_device";
  static constexpr std::string_view kLeafWeightFile = "blkio.leaf_weight";
  static constexpr std::string_view kLeafWeightDeviceFile =
      "blkio.leaf_weight_device";
  static constexpr std::string_view kReadBpsFile =
      "blkio.throttle.read_bps_device";
  static constexpr std::string_view kWriteBpsFile =
      "blkio.throttle.write_bps_device";
  static constexpr std::string_view kReadIopsFile =
      "blkio.throttle.read_iops_device";
  static constexpr std::string_view kWriteIopsFile =
      "blkio.throttle.write_iops_device";

  static constexpr std::string_view kTimeFile = "blkio.time";
  static constexpr std::string_view kSectorsFile = "blkio.sectors";
  static constexpr std::string_view kIoServicedFile = "blkio.io_serviced";
  static constexpr std::string_view kIoServiceBytesFile =
      "blkio.io_service_bytes";
  static constexpr std::string_view kIoServiceTimeFile =
      "blkio.io_service_time";
  static constexpr std::string_view kIoWaitTimeFile = "blkio.io_wait_time";
  static constexpr std::string_view kIoMergedFile = "blkio.io_merged";
  static constexpr std::string_view kIoQueuedFile = "blkio.io_queued";
  static constexpr std::string_view kThrottleIoServicedFile =
      "blkio.throttle.io_serviced";
  static constexpr std::string_view kThrottleIoServiceBytesFile =
      "blkio.throttle.io_service_bytes";

  static constexpr uint16_t kMinWeight = 10;
  static constexpr uint16_t kMaxWeight = 1000;

  using SubsystemOf::SubsystemOf;

  static CgExpected<void> Validate(const BlkIoResources &res);

  bool Configured(const Resources &resources) const override {
    return resources.blkio.has_value();
  }

  /**
   * weight, weight_device, leaf_weight, leaf_weight_device, then the four
   * throttle maps. Each map entry is one "major:minor value" write in
   * device order.
   */
  CgExpected<void> Apply(const Resources &resources) override;

  CgExpected<uint16_t> Weight() const;
  CgExpected<void> SetWeight(uint16_t weight);
  CgExpected<std::map<DeviceNumber, uint64_t>> WeightDevice() const;

  CgExpected<uint16_t> LeafWeight() const;
  CgExpected<void> SetLeafWeight(uint16_t weight);
  CgExpected<std::map<DeviceNumber, uint64_t>> LeafWeightDevice() const;

  CgExpected<std::map<DeviceNumber, uint64_t>> ReadBpsDevice() const;
  CgExpected<std::map<DeviceNumber, uint64_t>> WriteBpsDevice() const;
  CgExpected<std::map<DeviceNumber, uint64_t>> ReadIopsDevice() const;
  CgExpected<std::map<DeviceNumber, uint64_t>> WriteIopsDevice() const;

  // Per device disk time in milliseconds and sectors transferred.
  CgExpected<std::map<DeviceNumber, uint64_t>> Time() const;
  CgExpected<std::map<DeviceNumber, uint64_t>> Sectors() const;

  CgExpected<BlkIoStat> IoServiced() const;
  CgExpected<BlkIoStat> IoServiceBytes() const;
  CgExpected<BlkIoStat> IoServiceTime() const;
  CgExpected<BlkIoStat> IoWaitTime() const;
  CgExpected<BlkIoStat> IoMerged() const;
  CgExpected<BlkIoStat> IoQueued() const;
  CgExpected<BlkIoStat> ThrottleIoServiced() const;
  CgExpected<BlkIoStat> ThrottleIoServiceBytes() const;

 private:
  CgExpected<BlkIoStat> ReadIoStat_(std::string_view name) const;
};

}  // namespace cgkit
