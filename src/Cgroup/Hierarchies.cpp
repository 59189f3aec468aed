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

#include "cgkit/Hierarchies.h"

#ifdef CGKIT_HAVE_LIBCGROUP
#  include <libcgroup.h>

#  include <cstdlib>
#endif

#include <cerrno>

#include "cgkit/OS.h"
#include "cgkit/String.h"

namespace cgkit {

Hierarchies Hierarchies::Standard(const std::filesystem::path &root) {
  Hierarchies h;
  for (SubsystemKind kind : CgConstant::AllSubsystems())
    h.Set(kind, root / CgConstant::GetSubsystemStringView(kind));
  return h;
}

CgExpected<Hierarchies> Hierarchies::FromYaml(
    const std::filesystem::path &path) {
  if (!util::os::FileExists(path)) {
    CGKIT_ERROR("Hierarchy config file '{}' not existed", path.string());
    return std::unexpected(MakeIoErr(ENOENT, path, "open"));
  }

  try {
    YAML::Node config = YAML::LoadFile(path.string());
    auto result = FromYamlNode(config);
    if (!result) result.error().file = path.string();
    return result;
  } catch (YAML::BadFile &e) {
    CGKIT_ERROR("Can't open config file {}: {}", path.string(), e.what());
    return std::unexpected(MakeIoErr(EIO, path, "open"));
  } catch (YAML::Exception &e) {
    CGKIT_ERROR("Malformed config file {}: {}", path.string(), e.what());
    CgError err = FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                              "Malformed config file {}: {}", path.string(),
                              e.what());
    err.file = path.string();
    return std::unexpected(std::move(err));
  }
}

CgExpected<Hierarchies> Hierarchies::FromYamlNode(const YAML::Node &node) {
  Hierarchies h;

  try {
    h = Standard(util::YamlValueOr(node["CgroupRoot"], kDefaultCgroupRoot));

    if (const YAML::Node &map = node["Hierarchies"]; map) {
      if (!map.IsMap())
        return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                           "'Hierarchies' must be a map"));

      for (auto it = map.begin(); it != map.end(); ++it) {
        auto name = it->first.as<std::string>();
        auto kind = CgConstant::ParseSubsystemKind(name);
        if (!kind) {
          CGKIT_WARN("Unknown subsystem '{}' in hierarchy config", name);
          return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                             "Unknown subsystem '{}'", name));
        }

        auto root = it->second.IsNull() ? std::string{}
                                        : it->second.as<std::string>();
        if (root.empty())
          h.Erase(kind.value());
        else
          h.Set(kind.value(), root);
      }
    }
  } catch (YAML::Exception &e) {
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "Malformed hierarchy config: {}",
                                       e.what()));
  }

  CGKIT_DEBUG("Hierarchies from config: {} mounted",
              h.MountedFlags().Kinds().size());
  return h;
}

#ifdef CGKIT_HAVE_LIBCGROUP
CgExpected<Hierarchies> Hierarchies::FromLibcgroup() {
  CGKIT_DEBUG("Initializing cgroup library.");
  int ret = cgroup_init();
  if (ret != 0) {
    CGKIT_WARN("Unable to initialize libcgroup: {}", cgroup_strerror(ret));
    return std::unexpected(FormatCgErr(CgErrCode::NOT_MOUNTED,
                                       "libcgroup init failed: {}",
                                       cgroup_strerror(ret)));
  }

  Hierarchies h;
  void *handle = nullptr;
  controller_data info{};

  ret = cgroup_get_all_controller_begin(&handle, &info);
  while (ret == 0) {
    auto kind = CgConstant::ParseSubsystemKind(info.name);
    if (kind && info.hierarchy != 0) {
      char *mount_point = nullptr;
      if (cgroup_get_subsys_mount_point(info.name, &mount_point) == 0 &&
          mount_point != nullptr) {
        h.Set(kind.value(), mount_point);
        free(mount_point);
      }
    }
    ret = cgroup_get_all_controller_next(&handle, &info);
  }

  if (handle != nullptr) cgroup_get_all_controller_end(&handle);

  if (ret != ECGEOF) {
    CGKIT_WARN("Error iterating through cgroups mount information: {}",
               cgroup_strerror(ret));
    return std::unexpected(FormatCgErr(CgErrCode::NOT_MOUNTED,
                                       "Cannot list mounted controllers: {}",
                                       cgroup_strerror(ret)));
  }

  for (SubsystemKind kind : CgConstant::AllSubsystems())
    if (!h.Mounted(kind))
      CGKIT_DEBUG("Cgroup controller {} is not mounted", kind);

  return h;
}
#endif

SubsystemFlags Hierarchies::MountedFlags() const {
  SubsystemFlags flags;
  for (SubsystemKind kind : CgConstant::AllSubsystems())
    if (Mounted(kind)) flags |= kind;
  return flags;
}

std::optional<std::filesystem::path> Hierarchies::Resolve(
    const CgroupPath &path) const {
  const auto &root = MountRoot(path.Kind());
  if (!root) return std::nullopt;
  if (path.IsRoot()) return root.value();
  return root.value() / path.Relative();
}

}  // namespace cgkit
