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

#include "cgkit/String.h"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace cgkit::util {

namespace {

// Widest "lo-hi" range accepted in an id list.
constexpr uint32_t kMaxIdRangeWidth = 1U << 20;

}  // namespace

std::string ReadableMemory(uint64_t memory_bytes) {
  if (memory_bytes < 1024)
    return fmt::format("{}B", memory_bytes);
  else if (memory_bytes < 1024 * 1024)
    return fmt::format("{}K", memory_bytes / 1024);
  else if (memory_bytes < 1024 * 1024 * 1024)
    return fmt::format("{}M", memory_bytes / 1024 / 1024);
  else
    return fmt::format("{}G", memory_bytes / 1024 / 1024 / 1024);
}

bool ConvertStringToInt64(std::string_view s, int64_t *val) {
  s = absl::StripAsciiWhitespace(s);
  std::from_chars_result convert_result{};
  convert_result = std::from_chars(s.data(), s.data() + s.size(), *val);
  return convert_result.ec == std::errc() &&
         convert_result.ptr == s.data() + s.size() && !s.empty();
}

bool ConvertStringToUint64(std::string_view s, uint64_t *val) {
  s = absl::StripAsciiWhitespace(s);
  if (s.empty() || s.front() == '-' || s.front() == '+') return false;
  std::from_chars_result convert_result{};
  convert_result = std::from_chars(s.data(), s.data() + s.size(), *val);
  return convert_result.ec == std::errc() &&
         convert_result.ptr == s.data() + s.size();
}

bool ConvertStringToBool01(std::string_view s, bool *val) {
  s = absl::StripAsciiWhitespace(s);
  if (s == "0") {
    *val = false;
    return true;
  }
  if (s == "1") {
    *val = true;
    return true;
  }
  return false;
}

bool ParseIdList(std::string_view s, std::set<uint32_t> *ids) {
  ids->clear();
  s = absl::StripAsciiWhitespace(s);
  if (s.empty()) return true;

  for (std::string_view part : absl::StrSplit(s, ',')) {
    part = absl::StripAsciiWhitespace(part);
    if (part.empty()) return false;

    std::vector<std::string_view> bounds = absl::StrSplit(part, '-');
    uint32_t lo, hi;
    if (bounds.size() == 1) {
      if (!absl::SimpleAtoi(bounds[0], &lo)) return false;
      hi = lo;
    } else if (bounds.size() == 2) {
      if (!absl::SimpleAtoi(bounds[0], &lo) ||
          !absl::SimpleAtoi(bounds[1], &hi) || lo > hi)
        return false;
    } else {
      return false;
    }

    if (hi - lo > kMaxIdRangeWidth) return false;
    for (uint64_t id = lo; id <= hi; ++id)
      ids->emplace(static_cast<uint32_t>(id));
  }

  return true;
}

std::string FormatIdList(const std::set<uint32_t> &ids) {
  std::vector<std::string> ranges;

  auto it = ids.begin();
  while (it != ids.end()) {
    uint32_t lo = *it;
    uint32_t hi = lo;
    ++it;
    while (it != ids.end() && *it == hi + 1) {
      hi = *it;
      ++it;
    }

    if (lo == hi)
      ranges.emplace_back(fmt::format("{}", lo));
    else
      ranges.emplace_back(fmt::format("{}-{}", lo, hi));
  }

  return absl::StrJoin(ranges, ",");
}

std::vector<std::string_view> SplitNonEmptyLines(std::string_view s) {
  std::vector<std::string_view> lines;
  for (std::string_view line : absl::StrSplit(s, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) lines.emplace_back(line);
  }
  return lines;
}

std::vector<std::string_view> SplitFields(std::string_view line) {
  return absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
}

bool ParseMajorMinor(std::string_view s, bool allow_wildcard,
                     std::optional<uint64_t> *major,
                     std::optional<uint64_t> *minor) {
  std::vector<std::string_view> parts = absl::StrSplit(s, ':');
  if (parts.size() != 2) return false;

  auto parse_one = [allow_wildcard](std::string_view part,
                                    std::optional<uint64_t> *out) {
    if (part == "*") {
      if (!allow_wildcard) return false;
      *out = std::nullopt;
      return true;
    }
    uint64_t v;
    if (!ConvertStringToUint64(part, &v)) return false;
    *out = v;
    return true;
  };

  return parse_one(parts[0], major) && parse_one(parts[1], minor);
}

}  // namespace cgkit::util
