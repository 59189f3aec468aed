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

#include <absl/strings/str_join.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cgkit::util {

template <typename T = std::string, typename YamlNode, typename DefaultType>
  requires requires(const YamlNode &node) {
    { node.template as<T>() };
  } && std::convertible_to<DefaultType, T>
T YamlValueOr(const YamlNode &node, const DefaultType &default_value) {
  return node ? node.template as<T>() : default_value;
}

std::string ReadableMemory(uint64_t memory_bytes);

bool ConvertStringToInt64(std::string_view s, int64_t *val);

bool ConvertStringToUint64(std::string_view s, uint64_t *val);

// Accepts exactly "0" or "1", surrounding whitespace ignored.
bool ConvertStringToBool01(std::string_view s, bool *val);

/**
 * Parse a kernel id list such as "0-3,8,10-11" into a set. An empty or
 * all-whitespace string is a valid, empty list.
 */
bool ParseIdList(std::string_view s, std::set<uint32_t> *ids);

// Inverse of ParseIdList, consecutive ids are folded into ranges.
std::string FormatIdList(const std::set<uint32_t> &ids);

// Non-empty lines of s with surrounding ASCII whitespace stripped.
std::vector<std::string_view> SplitNonEmptyLines(std::string_view s);

// Whitespace separated fields of a single line.
std::vector<std::string_view> SplitFields(std::string_view line);

// Parse "major:minor". A '*' in either position yields std::nullopt there
// when allow_wildcard is set.
bool ParseMajorMinor(std::string_view s, bool allow_wildcard,
                     std::optional<uint64_t> *major,
                     std::optional<uint64_t> *minor);

}  // namespace cgkit::util
