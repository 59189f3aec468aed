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

#include <array>
#include <memory>
#include <string_view>
#include <vector>

#include "cgkit/Subsystem.h"

namespace cgkit {

/**
 * One logical cgroup spanning several v1 hierarchies: a handle per
 * controller, all at the same relative path.
 *
 * Fan-out operations visit the handles in SubsystemKind order. Every handle
 * is attempted; the failures are collected into one PARTIAL_FAILURE whose
 * `failures` name the kind and the underlying error of each. Nothing is
 * rolled back.
 */
class Cgroup {
 public:
  // ".." in relative is a programmer error, see CgroupPath.
  Cgroup(SubsystemFlags kinds, std::string_view relative,
         std::shared_ptr<const Hierarchies> hierarchies);

  // For untrusted relative paths.
  static CgExpected<Cgroup> Make(
      SubsystemFlags kinds, std::string_view relative,
      std::shared_ptr<const Hierarchies> hierarchies);

  Cgroup(const Cgroup &) = delete;
  Cgroup &operator=(const Cgroup &) = delete;

  Cgroup(Cgroup &&) noexcept = default;
  Cgroup &operator=(Cgroup &&) noexcept = default;

  ~Cgroup() = default;

  const std::string &Relative() const { return m_relative_; }
  const std::shared_ptr<const Hierarchies> &GetHierarchies() const {
    return m_hierarchies_;
  }

  bool Has(SubsystemKind kind) const {
    return m_subsystems_[static_cast<size_t>(kind)] != nullptr;
  }
  SubsystemFlags Kinds() const { return m_kinds_; }

  // nullptr if kind is not part of this cgroup.
  Subsystem *Get(SubsystemKind kind) const {
    return m_subsystems_[static_cast<size_t>(kind)].get();
  }

  template <typename T>
  T *Get() const {
    return static_cast<T *>(Get(T::kKind));
  }

  CgExpected<void> Create();

  // An already absent directory counts as deleted.
  CgExpected<void> Delete();

  CgExpected<void> AddTask(Pid pid);
  CgExpected<void> AddProc(Pid pid);
  CgExpected<void> RemoveTask(Pid pid);
  CgExpected<void> RemoveProc(Pid pid);

  // Handles without a record in resources are skipped without I/O.
  CgExpected<void> Apply(const Resources &resources);

  // Sorted union over every handle.
  CgExpected<std::vector<Pid>> Tasks() const;
  CgExpected<std::vector<Pid>> Procs() const;

 private:
  template <typename F>
  CgExpected<void> ForEach_(std::string_view action, F &&op) const;

  CgExpected<std::vector<Pid>> CollectPids_(
      std::string_view action,
      CgExpected<std::vector<Pid>> (Subsystem::*read)() const) const;

  std::string m_relative_;
  SubsystemFlags m_kinds_;
  std::shared_ptr<const Hierarchies> m_hierarchies_;
  std::array<std::unique_ptr<Subsystem>, kSubsystemCount> m_subsystems_;
};

}  // namespace cgkit
