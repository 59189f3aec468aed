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

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cgkit/CgroupError.h"
#include "cgkit/CgroupPath.h"
#include "cgkit/CgroupPublicDefs.h"
#include "cgkit/Hierarchies.h"
#include "cgkit/OS.h"
#include "cgkit/Resources.h"

namespace cgkit {

/**
 * Handle to one cgroup directory in the hierarchy of one controller.
 *
 * Constructing a handle never touches the filesystem and never fails.
 * Create() and Delete() are explicit; the destructor leaves the kernel
 * directory alone.
 */
class Subsystem {
 public:
  Subsystem(CgroupPath path, std::shared_ptr<const Hierarchies> hierarchies);
  virtual ~Subsystem() = default;

  Subsystem(const Subsystem &) = delete;
  Subsystem &operator=(const Subsystem &) = delete;

  Subsystem(Subsystem &&) noexcept = default;
  Subsystem &operator=(Subsystem &&) noexcept = default;

  SubsystemKind Kind() const { return m_path_.Kind(); }
  const CgroupPath &Path() const { return m_path_; }
  const std::shared_ptr<const Hierarchies> &GetHierarchies() const {
    return m_hierarchies_;
  }

  bool IsRoot() const { return m_path_.IsRoot(); }

  // NOT_MOUNTED when the hierarchy has no root for this kind.
  CgExpected<std::filesystem::path> Directory() const;

  bool Exists() const;

  // mkdir -p. An existing directory is success.
  CgExpected<void> Create();

  // rmdir. EBUSY while tasks or children are resident, ENOENT when absent.
  CgExpected<void> Delete();

  CgExpected<void> AddTask(Pid pid);
  CgExpected<void> AddProc(Pid pid);

  // Moves the task or process back to the root of this hierarchy.
  CgExpected<void> RemoveTask(Pid pid);
  CgExpected<void> RemoveProc(Pid pid);

  // dest must be of the same kind.
  CgExpected<void> MoveTaskTo(Pid pid, const Subsystem &dest) const;
  CgExpected<void> MoveProcTo(Pid pid, const Subsystem &dest) const;

  // In file order. An empty vector is a valid result.
  CgExpected<std::vector<Pid>> Tasks() const;
  CgExpected<std::vector<Pid>> Procs() const;

  // Immediate child cgroups, sorted by name.
  CgExpected<std::vector<CgroupPath>> Children() const;

  CgExpected<bool> NotifyOnRelease() const;
  CgExpected<void> SetNotifyOnRelease(bool enable);

  CgExpected<bool> CloneChildren() const;
  CgExpected<void> SetCloneChildren(bool enable);

  // Root only, INVALID_OPERATION elsewhere.
  CgExpected<std::string> ReleaseAgent() const;
  CgExpected<void> SetReleaseAgent(const std::filesystem::path &agent);

  // Whether this controller has a record to write in resources.
  virtual bool Configured(const Resources &resources) const = 0;

  /**
   * Writes every set field of this controller's record in the controller's
   * documented order. Unset fields and an absent record issue no write.
   * The first failed write stops the call; the error names the failed file
   * and lists the files already written. Nothing is rolled back.
   */
  virtual CgExpected<void> Apply(const Resources &resources) = 0;

  // Raw access to any file in this cgroup's directory.
  CgExpected<util::os::ScopedFd> OpenFile(std::string_view name,
                                          int flags) const;
  CgExpected<std::string> ReadFile(std::string_view name) const;
  CgExpected<void> WriteFile(std::string_view name, std::string_view content);
  bool FileExists(std::string_view name) const;

 protected:
  /**
   * Collects the writes of one Apply() call and stops at the first failure.
   */
  class WriteBatch {
   public:
    explicit WriteBatch(Subsystem *subsystem) : m_subsystem_(subsystem) {}

    void Write(std::string_view file, std::string_view value);

    // One write(2) per line.
    void WriteLines(std::string_view file,
                    const std::vector<std::string> &lines);

    template <typename T>
    void WriteIfSet(std::string_view file, const std::optional<T> &value) {
      if (value) Write(file, fmt::format("{}", value.value()));
    }

    void WriteIfSet(std::string_view file, const std::optional<bool> &value) {
      if (value) Write(file, value.value() ? "1" : "0");
    }

    const std::vector<std::string> &Committed() const { return m_committed_; }

    CgExpected<void> Finish() &&;

   private:
    Subsystem *m_subsystem_;
    std::vector<std::string> m_committed_;
    std::optional<CgError> m_error_;
  };

  CgExpected<std::filesystem::path> FilePath_(std::string_view name) const;

  CgExpected<uint64_t> ReadUint64_(std::string_view name) const;
  CgExpected<int64_t> ReadInt64_(std::string_view name) const;
  CgExpected<bool> ReadBool01_(std::string_view name) const;
  CgExpected<MaxValue> ReadMaxValue_(std::string_view name) const;
  CgExpected<std::set<uint32_t>> ReadIdList_(std::string_view name) const;

  // Whitespace separated unsigned numbers on one or more lines.
  CgExpected<std::vector<uint64_t>> ReadUint64List_(
      std::string_view name) const;

  // "key value" lines. Duplicate keys are a parse error.
  CgExpected<std::map<std::string, uint64_t>> ReadKeyValues_(
      std::string_view name) const;

  // "major:minor value" lines.
  CgExpected<std::map<DeviceNumber, uint64_t>> ReadDeviceValues_(
      std::string_view name) const;

  CgExpected<void> RequireRoot_(std::string_view what) const;

  // Logs a rejected record before it is returned.
  CgExpected<void> CheckValid_(CgExpected<void> valid) const;

  CgError ParseErr_(std::string_view name, std::string_view content) const;

 private:
  CgExpected<std::vector<Pid>> ReadPids_(std::string_view name) const;
  CgExpected<void> WritePid_(const std::filesystem::path &file, Pid pid) const;

  CgroupPath m_path_;
  std::shared_ptr<const Hierarchies> m_hierarchies_;
};

/**
 * Handle for a controller with kind K. Adds the compile-time kind used by
 * Cgroup::Get<T>().
 */
template <SubsystemKind K>
class SubsystemOf : public Subsystem {
 public:
  static constexpr SubsystemKind kKind = K;

  // The kind of path is replaced by K.
  SubsystemOf(const CgroupPath &path,
              std::shared_ptr<const Hierarchies> hierarchies)
      : Subsystem(path.WithKind(K), std::move(hierarchies)) {}
};

// Handle of the matching concrete class for kind.
std::unique_ptr<Subsystem> MakeSubsystem(
    SubsystemKind kind, const CgroupPath &path,
    std::shared_ptr<const Hierarchies> hierarchies);

}  // namespace cgkit
