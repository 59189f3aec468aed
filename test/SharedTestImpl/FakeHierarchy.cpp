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

#include "SharedTestImpl/FakeHierarchy.h"

#include <gtest/gtest.h>
#include <stdlib.h>

#include <fstream>
#include <vector>

#include "cgkit/OS.h"

namespace cgkit::test {

FakeHierarchy::FakeHierarchy() {
  std::string tmpl = testing::TempDir() + "cgkit_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    ADD_FAILURE() << "mkdtemp failed for " << tmpl;
    return;
  }
  m_root_ = buf.data();

  for (SubsystemKind kind : CgConstant::AllSubsystems()) {
    std::error_code ec;
    std::filesystem::create_directories(Dir(kind), ec);
    EXPECT_FALSE(ec) << ec.message();
  }
}

FakeHierarchy::~FakeHierarchy() {
  if (m_root_.empty()) return;
  std::error_code ec;
  std::filesystem::remove_all(m_root_, ec);
}

std::shared_ptr<const Hierarchies> FakeHierarchy::GetHierarchies() const {
  return std::make_shared<const Hierarchies>(Hierarchies::Standard(m_root_));
}

std::filesystem::path FakeHierarchy::Dir(SubsystemKind kind,
                                         std::string_view relative) const {
  std::filesystem::path dir =
      m_root_ / CgConstant::GetSubsystemStringView(kind);
  if (!relative.empty()) dir /= relative;
  return dir;
}

void FakeHierarchy::MakeCgroup(
    SubsystemKind kind, std::string_view relative,
    const std::map<std::string, std::string> &files) const {
  std::error_code ec;
  std::filesystem::create_directories(Dir(kind, relative), ec);
  ASSERT_FALSE(ec) << ec.message();

  WriteControlFile(kind, relative, CgConstant::kTasksFile, "");
  WriteControlFile(kind, relative, CgConstant::kProcsFile, "");
  WriteControlFile(kind, relative, CgConstant::kNotifyOnReleaseFile, "0\n");
  WriteControlFile(kind, relative, CgConstant::kCloneChildrenFile, "0\n");
  for (const auto &[name, content] : files)
    WriteControlFile(kind, relative, name, content);
}

void FakeHierarchy::WriteControlFile(SubsystemKind kind,
                                     std::string_view relative,
                                     std::string_view name,
                                     std::string_view content) const {
  std::ofstream out(Dir(kind, relative) / name, std::ios::trunc);
  ASSERT_TRUE(out.is_open()) << (Dir(kind, relative) / name);
  out << content;
}

std::string FakeHierarchy::ReadControlFile(SubsystemKind kind,
                                           std::string_view relative,
                                           std::string_view name) const {
  std::string content;
  int err = util::os::ReadFileIntoString(Dir(kind, relative) / name, &content);
  EXPECT_EQ(err, 0) << (Dir(kind, relative) / name);
  return content;
}

void FakeHierarchy::RemoveMountRoot(SubsystemKind kind) const {
  std::error_code ec;
  std::filesystem::remove_all(Dir(kind), ec);
  EXPECT_FALSE(ec) << ec.message();
}

}  // namespace cgkit::test
