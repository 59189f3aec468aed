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

#include "cgkit/BlkIo.h"

#include "cgkit/String.h"

namespace cgkit {

namespace {

template <typename T>
std::vector<std::string> FormatDeviceMap(const std::map<DeviceNumber, T> &m) {
  std::vector<std::string> lines;
  lines.reserve(m.size());
  for (const auto &[dev, value] : m)
    lines.emplace_back(fmt::format("{} {}", dev, value));
  return lines;
}

CgExpected<void> CheckWeight(std::string_view what, uint16_t weight) {
  if (weight < BlkIoSubsystem::kMinWeight ||
      weight > BlkIoSubsystem::kMaxWeight)
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "{} {} is out of [{}, {}]", what, weight,
        BlkIoSubsystem::kMinWeight, BlkIoSubsystem::kMaxWeight));
  return {};
}

}  // namespace

CgExpected<void> BlkIoSubsystem::Validate(const BlkIoResources &res) {
  if (res.weight) {
    if (auto ok = CheckWeight("blkio weight", res.weight.value()); !ok)
      return ok;
  }
  if (res.leaf_weight) {
    if (auto ok = CheckWeight("blkio leaf_weight", res.leaf_weight.value());
        !ok)
      return ok;
  }

  for (const auto *m : {&res.weight_device, &res.leaf_weight_device}) {
    if (!m->has_value()) continue;
    for (const auto &[dev, weight] : m->value()) {
      // 0 removes the per device weight.
      if (weight == 0) continue;
      if (auto ok = CheckWeight(fmt::format("blkio weight of {}", dev), weight);
          !ok)
        return ok;
    }
  }

  return {};
}

CgExpected<void> BlkIoSubsystem::Apply(const Resources &resources) {
  if (!resources.blkio) return {};
  const BlkIoResources &res = resources.blkio.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  batch.WriteIfSet(kWeightFile, res.weight);
  if (res.weight_device)
    batch.WriteLines(kWeightDeviceFile,
                     FormatDeviceMap(res.weight_device.value()));
  batch.WriteIfSet(kLeafWeightFile, res.leaf_weight);
  if (res.leaf_weight_device)
    batch.WriteLines(kLeafWeightDeviceFile,
                     FormatDeviceMap(res.leaf_weight_device.value()));

  if (res.read_bps_device)
    batch.WriteLines(kReadBpsFile,
                     FormatDeviceMap(res.read_bps_device.value()));
  if (res.write_bps_device)
    batch.WriteLines(kWriteBpsFile,
                     FormatDeviceMap(res.write_bps_device.value()));
  if (res.read_iops_device)
    batch.WriteLines(kReadIopsFile,
                     FormatDeviceMap(res.read_iops_device.value()));
  if (res.write_iops_device)
    batch.WriteLines(kWriteIopsFile,
                     FormatDeviceMap(res.write_iops_device.value()));
  return std::move(batch).Finish();
}

CgExpected<uint16_t> BlkIoSubsystem::Weight() const {
  auto v = ReadUint64_(kWeightFile);
  if (!v) return std::unexpected(std::move(v).error());
  if (v.value() > UINT16_MAX)
    return std::unexpected(
        ParseErr_(kWeightFile, fmt::format("{}", v.value())));
  return static_cast<uint16_t>(v.value());
}

CgExpected<void> BlkIoSubsystem::SetWeight(uint16_t weight) {
  return Apply(Resources{.blkio = BlkIoResources{.weight = weight}});
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::WeightDevice()
    const {
  return ReadDeviceValues_(kWeightDeviceFile);
}

CgExpected<uint16_t> BlkIoSubsystem::LeafWeight() const {
  auto v = ReadUint64_(kLeafWeightFile);
  if (!v) return std::unexpected(std::move(v).error());
  if (v.value() > UINT16_MAX)
    return std::unexpected(
        ParseErr_(kLeafWeightFile, fmt::format("{}", v.value())));
  return static_cast<uint16_t>(v.value());
}

CgExpected<void> BlkIoSubsystem::SetLeafWeight(uint16_t weight) {
  return Apply(Resources{.blkio = BlkIoResources{.leaf_weight = weight}});
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::LeafWeightDevice()
    const {
  return ReadDeviceValues_(kLeafWeightDeviceFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::ReadBpsDevice()
    const {
  return ReadDeviceValues_(kReadBpsFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::WriteBpsDevice()
    const {
  return ReadDeviceValues_(kWriteBpsFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::ReadIopsDevice()
    const {
  return ReadDeviceValues_(kReadIopsFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::WriteIopsDevice()
    const {
  return ReadDeviceValues_(kWriteIopsFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::Time() const {
  return ReadDeviceValues_(kTimeFile);
}

CgExpected<std::map<DeviceNumber, uint64_t>> BlkIoSubsystem::Sectors() const {
  return ReadDeviceValues_(kSectorsFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::ReadIoStat_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  BlkIoStat stat;
  bool has_total = false;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::vector<std::string_view> fields = util::SplitFields(line);

    if (fields.size() == 2 && fields[0] == "Total") {
      if (has_total || !util::ConvertStringToUint64(fields[1], &stat.total))
        return std::unexpected(ParseErr_(name, content.value()));
      has_total = true;
      continue;
    }

    std::optional<uint64_t> major, minor;
    uint64_t v;
    if (fields.size() != 3 ||
        !util::ParseMajorMinor(fields[0], false, &major, &minor) ||
        !util::ConvertStringToUint64(fields[2], &v))
      return std::unexpected(ParseErr_(name, content.value()));

    stat.entries.emplace_back(BlkIoStatEntry{
        .device = DeviceNumber{major.value(), minor.value()},
        .op = std::string(fields[1]),
        .value = v});
  }

  if (!has_total) return std::unexpected(ParseErr_(name, content.value()));
  return stat;
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoServiced() const {
  return ReadIoStat_(kIoServicedFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoServiceBytes() const {
  return ReadIoStat_(kIoServiceBytesFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoServiceTime() const {
  return ReadIoStat_(kIoServiceTimeFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoWaitTime() const {
  return ReadIoStat_(kIoWaitTimeFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoMerged() const {
  return ReadIoStat_(kIoMergedFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::IoQueued() const {
  return ReadIoStat_(kIoQueuedFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::ThrottleIoServiced() const {
  return ReadIoStat_(kThrottleIoServicedFile);
}

CgExpected<BlkIoStat> BlkIoSubsystem::ThrottleIoServiceBytes() const {
  return ReadIoStat_(kThrottleIoServiceBytesFile);
}

}  // namespace cgkit
