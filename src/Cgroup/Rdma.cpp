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

#include "cgkit/Rdma.h"

#include <absl/strings/str_split.h>

#include <algorithm>

#include "cgkit/String.h"

namespace cgkit {

namespace {

constexpr std::string_view kHcaHandle = "hca_handle";
constexpr std::string_view kHcaObject = "hca_object";

bool ValidDeviceName(std::string_view name) {
  if (name.empty()) return false;
  return std::ranges::all_of(name, [](char c) {
    return c != ' ' && c != '\t' && c != '\n' && c != '=';
  });
}

std::string FormatLimitLine(const std::string &device,
                            const RdmaLimit &limit) {
  std::string line = device;
  if (limit.hca_handle)
    line += fmt::format(" {}={}", kHcaHandle, limit.hca_handle->ToString());
  if (limit.hca_object)
    line += fmt::format(" {}={}", kHcaObject, limit.hca_object->ToString());
  return line;
}

// Splits every "key=value" field after the device name of one line. The
// callback returns false on a value it cannot take.
template <typename F>
bool ForEachRdmaField(const std::vector<std::string_view> &fields,
                      F &&on_field) {
  for (size_t i = 1; i < fields.size(); i++) {
    std::pair<std::string_view, std::string_view> kv =
        absl::StrSplit(fields[i], absl::MaxSplits('=', 1));
    if (kv.first.empty() || kv.second.empty()) return false;
    if (!on_field(kv.first, kv.second)) return false;
  }
  return true;
}

}  // namespace

CgExpected<void> RdmaSubsystem::Validate(const RdmaResources &res) {
  if (!res.max) return {};

  for (const auto &[device, limit] : res.max.value()) {
    if (!ValidDeviceName(device))
      return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                         "Invalid rdma device name '{}'",
                                         device));
    if (!limit.hca_handle && !limit.hca_object)
      return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                         "rdma limit of {} sets nothing",
                                         device));
  }
  return {};
}

CgExpected<void> RdmaSubsystem::Apply(const Resources &resources) {
  if (!resources.rdma) return {};
  const RdmaResources &res = resources.rdma.value();

  if (auto ok = CheckValid_(Validate(res)); !ok) return ok;

  WriteBatch batch(this);
  if (res.max) {
    std::vector<std::string> lines;
    for (const auto &[device, limit] : res.max.value())
      lines.emplace_back(FormatLimitLine(device, limit));
    batch.WriteLines(kMaxFile, lines);
  }
  return std::move(batch).Finish();
}

CgExpected<std::map<std::string, RdmaLimit>> RdmaSubsystem::Max() const {
  auto content = ReadFile(kMaxFile);
  if (!content) return std::unexpected(std::move(content).error());

  std::map<std::string, RdmaLimit> limits;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::vector<std::string_view> fields = util::SplitFields(line);
    RdmaLimit limit;
    bool ok = ForEachRdmaField(
        fields, [&limit](std::string_view key, std::string_view value) {
          auto v = MaxValue::Parse(value);
          if (!v) return false;
          if (key == kHcaHandle)
            limit.hca_handle = v;
          else if (key == kHcaObject)
            limit.hca_object = v;
          return true;
        });
    if (!ok || !limits.emplace(fields[0], limit).second)
      return std::unexpected(ParseErr_(kMaxFile, content.value()));
  }
  return limits;
}

CgExpected<std::map<std::string, RdmaUsage>> RdmaSubsystem::Current() const {
  auto content = ReadFile(kCurrentFile);
  if (!content) return std::unexpected(std::move(content).error());

  std::map<std::string, RdmaUsage> usage;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::vector<std::string_view> fields = util::SplitFields(line);
    RdmaUsage u;
    bool ok = ForEachRdmaField(
        fields, [&u](std::string_view key, std::string_view value) {
          uint64_t v;
          if (!util::ConvertStringToUint64(value, &v)) return false;
          if (key == kHcaHandle)
            u.hca_handle = v;
          else if (key == kHcaObject)
            u.hca_object = v;
          return true;
        });
    if (!ok || !usage.emplace(fields[0], u).second)
      return std::unexpected(ParseErr_(kCurrentFile, content.value()));
  }
  return usage;
}

CgExpected<void> RdmaSubsystem::SetMax(const std::string &device,
                                       const RdmaLimit &limit) {
  return Apply(Resources{
      .rdma = RdmaResources{.max = std::map<std::string, RdmaLimit>{
                                {device, limit}}}});
}

}  // namespace cgkit
