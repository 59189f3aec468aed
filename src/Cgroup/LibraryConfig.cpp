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

#include "cgkit/LibraryConfig.h"

#include <cerrno>

#include "cgkit/OS.h"
#include "cgkit/String.h"

namespace cgkit {

CgExpected<LibraryConfig> LibraryConfig::Load(
    const std::filesystem::path &path) {
  if (!util::os::FileExists(path)) {
    CGKIT_ERROR("Config file {} does not exist", path.string());
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

CgExpected<LibraryConfig> LibraryConfig::FromYamlNode(const YAML::Node &node) {
  LibraryConfig config;

  try {
    config.CgkitDebugLevel = util::YamlValueOr(node["CgkitDebugLevel"], "info");
    config.CgkitLogFile =
        util::YamlValueOr(node["CgkitLogFile"], kDefaultLogPath);
    config.CgkitLogToConsole =
        util::YamlValueOr<bool>(node["CgkitLogToConsole"], true);
    config.CgkitMaxLogFileSize = util::YamlValueOr<uint64_t>(
        node["CgkitMaxLogFileSize"], kDefaultMaxLogFileSize);
    config.CgkitMaxLogFileNum = util::YamlValueOr<uint64_t>(
        node["CgkitMaxLogFileNum"], kDefaultMaxLogFileNum);
  } catch (YAML::Exception &e) {
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "Malformed library config: {}", e.what()));
  }

  if (!StrToLogLevel(config.CgkitDebugLevel))
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "Illegal CgkitDebugLevel '{}'",
                                       config.CgkitDebugLevel));

  if (config.CgkitMaxLogFileNum == 0)
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "CgkitMaxLogFileNum must be positive"));

  auto hierarchies = Hierarchies::FromYamlNode(node);
  if (!hierarchies) return std::unexpected(std::move(hierarchies).error());
  config.CgroupHierarchies =
      std::make_shared<const Hierarchies>(std::move(hierarchies).value());

  return config;
}

CgExpected<void> LibraryConfig::InitLogger() const {
  auto level = StrToLogLevel(CgkitDebugLevel);
  if (!level)
    return std::unexpected(FormatCgErr(CgErrCode::INVALID_ARGUMENT,
                                       "Illegal CgkitDebugLevel '{}'",
                                       CgkitDebugLevel));

  ::InitLogger(level.value(), CgkitLogFile, CgkitLogToConsole,
               CgkitMaxLogFileSize, CgkitMaxLogFileNum);
  return {};
}

}  // namespace cgkit
