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

#include <yaml-cpp/yaml.h>

#include <array>
#include <filesystem>
#include <optional>

#include "cgkit/CgroupError.h"
#include "cgkit/CgroupPath.h"
#include "cgkit/CgroupPublicDefs.h"

namespace cgkit {

/**
 * Maps every subsystem kind to the mount root of its v1 hierarchy. Kinds
 * without an entry are treated as not mounted.
 *
 * Shared read-only between handles through
 * std::shared_ptr<const Hierarchies>.
 */
class Hierarchies {
 public:
  Hierarchies() = default;

  // <root>/<kernel name> for every kind.
  static Hierarchies Standard(
      const std::filesystem::path &root = kDefaultCgroupRoot);

  /**
   * Keys:
   *   CgroupRoot:  seeds the standard layout under this directory.
   *   Hierarchies: map of kernel name to mount root. An empty value removes
   *                the kind.
   * Missing file is IO, malformed content is INVALID_ARGUMENT.
   */
  static CgExpected<Hierarchies> FromYaml(const std::filesystem::path &path);
  static CgExpected<Hierarchies> FromYamlNode(const YAML::Node &node);

#ifdef CGKIT_HAVE_LIBCGROUP
  // Only the kinds libcgroup reports as mounted are present.
  static CgExpected<Hierarchies> FromLibcgroup();
#endif

  bool Mounted(SubsystemKind kind) const {
    return m_roots_[static_cast<size_t>(kind)].has_value();
  }

  const std::optional<std::filesystem::path> &MountRoot(
      SubsystemKind kind) const {
    return m_roots_[static_cast<size_t>(kind)];
  }

  void Set(SubsystemKind kind, std::filesystem::path root) {
    m_roots_[static_cast<size_t>(kind)] = std::move(root);
  }

  void Erase(SubsystemKind kind) {
    m_roots_[static_cast<size_t>(kind)].reset();
  }

  SubsystemFlags MountedFlags() const;

  // mount_root(kind) / relative. std::nullopt when the kind has no entry.
  std::optional<std::filesystem::path> Resolve(const CgroupPath &path) const;

 private:
  std::array<std::optional<std::filesystem::path>, kSubsystemCount> m_roots_;
};

}  // namespace cgkit
