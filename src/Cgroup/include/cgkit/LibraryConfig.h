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

#include <filesystem>
#include <memory>
#include <string>

#include "cgkit/CgroupError.h"
#include "cgkit/Hierarchies.h"

namespace cgkit {

/**
 * Settings of a host process embedding the library, read from one YAML
 * file:
 *
 *   CgkitDebugLevel: debug
 *   CgkitLogFile: /var/log/cgkit/cgkit.log
 *   CgkitLogToConsole: true
 *   CgkitMaxLogFileSize: 52428800
 *   CgkitMaxLogFileNum: 3
 *   CgroupRoot: /sys/fs/cgroup
 *   Hierarchies:
 *     cpu: /sys/fs/cgroup/cpu,cpuacct
 *     rdma: ""
 *
 * Every key is optional.
 */
struct LibraryConfig {
  std::string CgkitDebugLevel{"info"};
  std::filesystem::path CgkitLogFile{kDefaultLogPath};
  bool CgkitLogToConsole{true};
  uint64_t CgkitMaxLogFileSize{kDefaultMaxLogFileSize};
  uint64_t CgkitMaxLogFileNum{kDefaultMaxLogFileNum};

  std::shared_ptr<const Hierarchies> CgroupHierarchies;

  // Missing file is IO, malformed content or an unknown level is
  // INVALID_ARGUMENT.
  static CgExpected<LibraryConfig> Load(
      const std::filesystem::path &path = kDefaultConfigPath);
  static CgExpected<LibraryConfig> FromYamlNode(const YAML::Node &node);

  // Installs the default logger from the Cgkit* keys.
  CgExpected<void> InitLogger() const;
};

}  // namespace cgkit
