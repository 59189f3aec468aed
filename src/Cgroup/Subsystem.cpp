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

#include "cgkit/Subsystem.h"

#include <absl/strings/ascii.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "cgkit/String.h"

namespace cgkit {

Pid Pid::Self() noexcept { return Pid(getpid()); }

Subsystem::Subsystem(CgroupPath path,
                     std::shared_ptr<const Hierarchies> hierarchies)
    : m_path_(std::move(path)), m_hierarchies_(std::move(hierarchies)) {
  CGKIT_ASSERT(m_hierarchies_ != nullptr);
}

CgExpected<std::filesystem::path> Subsystem::Directory() const {
  auto dir = m_hierarchies_->Resolve(m_path_);
  if (!dir) {
    CgError err = FormatCgErr(CgErrCode::NOT_MOUNTED,
                              "Cgroup controller {} is not mounted", Kind());
    return std::unexpected(std::move(err));
  }
  return std::move(dir).value();
}

bool Subsystem::Exists() const {
  auto dir = Directory();
  return dir && util::os::IsDirectory(dir.value());
}

CgExpected<void> Subsystem::Create() {
  const auto &root = m_hierarchies_->MountRoot(Kind());
  if (!root || !util::os::IsDirectory(root.value())) {
    CGKIT_WARN("Unable to create {} because cgroup {} is not mounted.",
               m_path_, Kind());
    CgError err = FormatCgErr(CgErrCode::NOT_MOUNTED,
                              "Cgroup controller {} is not mounted", Kind());
    if (root) err.file = root.value().string();
    return std::unexpected(std::move(err));
  }

  auto dir = Directory();
  if (!dir) return std::unexpected(std::move(dir).error());

  int err = util::os::CreateFolders(dir.value());
  if (err != 0) {
    CGKIT_ERROR("Unable to create cgroup {}: {}", m_path_,
                std::strerror(err));
    return std::unexpected(MakeIoErr(err, dir.value(), "create"));
  }

  CGKIT_DEBUG("Created cgroup {}.", m_path_);
  return {};
}

CgExpected<void> Subsystem::Delete() {
  auto dir = Directory();
  if (!dir) return std::unexpected(std::move(dir).error());

  int err = util::os::RemoveFolder(dir.value());
  if (err != 0) {
    CGKIT_WARN("Unable to remove cgroup {}: {}", m_path_, std::strerror(err));
    return std::unexpected(MakeIoErr(err, dir.value(), "remove"));
  }

  CGKIT_DEBUG("Removed cgroup {}.", m_path_);
  return {};
}

CgExpected<void> Subsystem::WritePid_(const std::filesystem::path &file,
                                      Pid pid) const {
  int err = util::os::WriteStringToFile(file, fmt::format("{}", pid));
  if (err != 0) {
    CGKIT_WARN("Cannot attach pid {} via {}: {}", pid, file.string(),
               std::strerror(err));
    return std::unexpected(MakeIoErr(err, file, "write"));
  }
  CGKIT_TRACE("Wrote pid {} to {}", pid, file.string());
  return {};
}

CgExpected<void> Subsystem::AddTask(Pid pid) {
  auto file = FilePath_(CgConstant::kTasksFile);
  if (!file) return std::unexpected(std::move(file).error());
  return WritePid_(file.value(), pid);
}

CgExpected<void> Subsystem::AddProc(Pid pid) {
  auto file = FilePath_(CgConstant::kProcsFile);
  if (!file) return std::unexpected(std::move(file).error());
  return WritePid_(file.value(), pid);
}

CgExpected<void> Subsystem::RemoveTask(Pid pid) {
  auto root = Directory();
  if (!root) return std::unexpected(std::move(root).error());

  const auto &mount_root = m_hierarchies_->MountRoot(Kind()).value();
  return WritePid_(mount_root / CgConstant::kTasksFile, pid);
}

CgExpected<void> Subsystem::RemoveProc(Pid pid) {
  auto root = Directory();
  if (!root) return std::unexpected(std::move(root).error());

  const auto &mount_root = m_hierarchies_->MountRoot(Kind()).value();
  return WritePid_(mount_root / CgConstant::kProcsFile, pid);
}

CgExpected<void> Subsystem::MoveTaskTo(Pid pid, const Subsystem &dest) const {
  if (dest.Kind() != Kind()) {
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "Cannot move pid {} from {} to {}", pid,
        m_path_, dest.Path()));
  }

  auto file = dest.FilePath_(CgConstant::kTasksFile);
  if (!file) return std::unexpected(std::move(file).error());
  return WritePid_(file.value(), pid);
}

CgExpected<void> Subsystem::MoveProcTo(Pid pid, const Subsystem &dest) const {
  if (dest.Kind() != Kind()) {
    return std::unexpected(FormatCgErr(
        CgErrCode::INVALID_ARGUMENT, "Cannot move pid {} from {} to {}", pid,
        m_path_, dest.Path()));
  }

  auto file = dest.FilePath_(CgConstant::kProcsFile);
  if (!file) return std::unexpected(std::move(file).error());
  return WritePid_(file.value(), pid);
}

CgExpected<std::vector<Pid>> Subsystem::ReadPids_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  std::vector<Pid> pids;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    int64_t v;
    if (!util::ConvertStringToInt64(line, &v) || v <= 0)
      return std::unexpected(ParseErr_(name, content.value()));
    pids.emplace_back(static_cast<pid_t>(v));
  }
  return pids;
}

CgExpected<std::vector<Pid>> Subsystem::Tasks() const {
  return ReadPids_(CgConstant::kTasksFile);
}

CgExpected<std::vector<Pid>> Subsystem::Procs() const {
  return ReadPids_(CgConstant::kProcsFile);
}

CgExpected<std::vector<CgroupPath>> Subsystem::Children() const {
  auto dir = Directory();
  if (!dir) return std::unexpected(std::move(dir).error());

  std::vector<std::string> names;
  int err = util::os::ListSubFolders(dir.value(), &names);
  if (err != 0) return std::unexpected(MakeIoErr(err, dir.value(), "list"));

  std::vector<CgroupPath> children;
  children.reserve(names.size());
  for (const auto &name : names) {
    auto child = m_path_.Join(name);
    if (!child) return std::unexpected(std::move(child).error());
    children.emplace_back(std::move(child).value());
  }
  return children;
}

CgExpected<bool> Subsystem::NotifyOnRelease() const {
  return ReadBool01_(CgConstant::kNotifyOnReleaseFile);
}

CgExpected<void> Subsystem::SetNotifyOnRelease(bool enable) {
  return WriteFile(CgConstant::kNotifyOnReleaseFile, enable ? "1" : "0");
}

CgExpected<bool> Subsystem::CloneChildren() const {
  return ReadBool01_(CgConstant::kCloneChildrenFile);
}

CgExpected<void> Subsystem::SetCloneChildren(bool enable) {
  return WriteFile(CgConstant::kCloneChildrenFile, enable ? "1" : "0");
}

CgExpected<std::string> Subsystem::ReleaseAgent() const {
  if (auto ok = RequireRoot_("release_agent"); !ok)
    return std::unexpected(std::move(ok).error());

  auto content = ReadFile(CgConstant::kReleaseAgentFile);
  if (!content) return content;
  return std::string(absl::StripAsciiWhitespace(content.value()));
}

CgExpected<void> Subsystem::SetReleaseAgent(
    const std::filesystem::path &agent) {
  if (auto ok = RequireRoot_("release_agent"); !ok) return ok;
  return WriteFile(CgConstant::kReleaseAgentFile, agent.string());
}

CgExpected<std::filesystem::path> Subsystem::FilePath_(
    std::string_view name) const {
  auto dir = Directory();
  if (!dir) return dir;
  return dir.value() / name;
}

CgExpected<util::os::ScopedFd> Subsystem::OpenFile(std::string_view name,
                                                   int flags) const {
  auto file = FilePath_(name);
  if (!file) return std::unexpected(std::move(file).error());

  util::os::ScopedFd fd;
  int err = util::os::OpenFile(file.value(), flags, &fd);
  if (err != 0) return std::unexpected(MakeIoErr(err, file.value(), "open"));
  return fd;
}

CgExpected<std::string> Subsystem::ReadFile(std::string_view name) const {
  auto file = FilePath_(name);
  if (!file) return std::unexpected(std::move(file).error());

  std::string content;
  int err = util::os::ReadFileIntoString(file.value(), &content);
  if (err != 0) {
    CGKIT_WARN("Failed to read {}: {}", file.value().string(),
               std::strerror(err));
    return std::unexpected(MakeIoErr(err, file.value(), "read"));
  }
  return content;
}

CgExpected<void> Subsystem::WriteFile(std::string_view name,
                                      std::string_view content) {
  auto file = FilePath_(name);
  if (!file) return std::unexpected(std::move(file).error());

  int err = util::os::WriteStringToFile(file.value(), content);
  if (err != 0) {
    CGKIT_WARN("Failed to write '{}' to {}: {}", content,
               file.value().string(), std::strerror(err));
    return std::unexpected(MakeIoErr(err, file.value(), "write"));
  }

  CGKIT_TRACE("Wrote '{}' to {}", content, file.value().string());
  return {};
}

bool Subsystem::FileExists(std::string_view name) const {
  auto file = FilePath_(name);
  return file && util::os::FileExists(file.value());
}

void Subsystem::WriteBatch::Write(std::string_view file,
                                  std::string_view value) {
  if (m_error_) return;

  auto result = m_subsystem_->WriteFile(file, value);
  if (!result) {
    m_error_ = std::move(result).error();
    return;
  }
  m_committed_.emplace_back(file);
}

void Subsystem::WriteBatch::WriteLines(std::string_view file,
                                       const std::vector<std::string> &lines) {
  if (m_error_ || lines.empty()) return;

  auto path = m_subsystem_->FilePath_(file);
  if (!path) {
    m_error_ = std::move(path).error();
    return;
  }

  int err = util::os::WriteLinesToFile(path.value(), lines);
  if (err != 0) {
    CGKIT_WARN("Failed to write {} line(s) to {}: {}", lines.size(),
               path.value().string(), std::strerror(err));
    m_error_ = MakeIoErr(err, path.value(), "write");
    return;
  }

  CGKIT_TRACE("Wrote {} line(s) to {}", lines.size(), path.value().string());
  m_committed_.emplace_back(file);
}

CgExpected<void> Subsystem::WriteBatch::Finish() && {
  if (!m_error_) return {};

  CgError err = std::move(m_error_).value();
  err.committed = std::move(m_committed_);
  if (!err.committed.empty())
    CGKIT_WARN("Apply on {} stopped at {} after {} write(s)",
               m_subsystem_->Path(), err.file, err.committed.size());
  return std::unexpected(std::move(err));
}

CgExpected<uint64_t> Subsystem::ReadUint64_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  uint64_t v;
  if (!util::ConvertStringToUint64(content.value(), &v))
    return std::unexpected(ParseErr_(name, content.value()));
  return v;
}

CgExpected<int64_t> Subsystem::ReadInt64_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  int64_t v;
  if (!util::ConvertStringToInt64(content.value(), &v))
    return std::unexpected(ParseErr_(name, content.value()));
  return v;
}

CgExpected<bool> Subsystem::ReadBool01_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  bool v;
  if (!util::ConvertStringToBool01(content.value(), &v))
    return std::unexpected(ParseErr_(name, content.value()));
  return v;
}

CgExpected<MaxValue> Subsystem::ReadMaxValue_(std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  auto v = MaxValue::Parse(content.value());
  if (!v) return std::unexpected(ParseErr_(name, content.value()));
  return v.value();
}

CgExpected<std::set<uint32_t>> Subsystem::ReadIdList_(
    std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  std::set<uint32_t> ids;
  if (!util::ParseIdList(content.value(), &ids))
    return std::unexpected(ParseErr_(name, content.value()));
  return ids;
}

CgExpected<std::vector<uint64_t>> Subsystem::ReadUint64List_(
    std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  std::vector<uint64_t> values;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    for (std::string_view field : util::SplitFields(line)) {
      uint64_t v;
      if (!util::ConvertStringToUint64(field, &v))
        return std::unexpected(ParseErr_(name, content.value()));
      values.push_back(v);
    }
  }
  return values;
}

CgExpected<std::map<std::string, uint64_t>> Subsystem::ReadKeyValues_(
    std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  std::map<std::string, uint64_t> kv;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::vector<std::string_view> fields = util::SplitFields(line);
    uint64_t v;
    if (fields.size() != 2 || !util::ConvertStringToUint64(fields[1], &v))
      return std::unexpected(ParseErr_(name, content.value()));
    if (!kv.emplace(fields[0], v).second)
      return std::unexpected(ParseErr_(name, content.value()));
  }
  return kv;
}

CgExpected<std::map<DeviceNumber, uint64_t>> Subsystem::ReadDeviceValues_(
    std::string_view name) const {
  auto content = ReadFile(name);
  if (!content) return std::unexpected(std::move(content).error());

  std::map<DeviceNumber, uint64_t> values;
  for (std::string_view line : util::SplitNonEmptyLines(content.value())) {
    std::vector<std::string_view> fields = util::SplitFields(line);
    std::optional<uint64_t> major, minor;
    uint64_t v;
    if (fields.size() != 2 ||
        !util::ParseMajorMinor(fields[0], false, &major, &minor) ||
        !util::ConvertStringToUint64(fields[1], &v))
      return std::unexpected(ParseErr_(name, content.value()));
    values[DeviceNumber{major.value(), minor.value()}] = v;
  }
  return values;
}

CgExpected<void> Subsystem::RequireRoot_(std::string_view what) const {
  if (IsRoot()) return {};

  CGKIT_WARN("{} is only available on the root of the {} hierarchy, not {}",
             what, Kind(), m_path_);
  return std::unexpected(
      FormatCgErr(CgErrCode::INVALID_OPERATION,
                  "{} is only available on the root cgroup, not {}", what,
                  m_path_));
}

CgExpected<void> Subsystem::CheckValid_(CgExpected<void> valid) const {
  if (!valid)
    CGKIT_WARN("Rejected {} settings for {}: {}", Kind(), m_path_,
               valid.error().description);
  return valid;
}

CgError Subsystem::ParseErr_(std::string_view name,
                             std::string_view content) const {
  std::filesystem::path file{std::string(name)};
  if (auto dir = Directory(); dir) file = dir.value() / name;
  CGKIT_WARN("Cannot parse {} of {}", name, m_path_);
  return MakeParseErr(file, content);
}

}  // namespace cgkit
