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

#include <gtest/gtest.h>
#include <stdlib.h>

#include <cerrno>
#include <fstream>

#include "cgkit/OS.h"

using namespace cgkit;

class OsTest : public ::testing::Test {
 public:
  void SetUp() override {
    std::string tmpl = testing::TempDir() + "cgkit_os_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
    m_dir_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(m_dir_, ec);
  }

 protected:
  std::filesystem::path m_dir_;
};

TEST_F(OsTest, WriteNeverCreatesFiles) {
  std::filesystem::path file = m_dir_ / "cpu.shares";

  EXPECT_EQ(util::os::WriteStringToFile(file, "1024"), ENOENT);
  EXPECT_FALSE(util::os::FileExists(file));

  std::ofstream(file) << "2";
  ASSERT_EQ(util::os::WriteStringToFile(file, "1024"), 0);

  std::string content;
  ASSERT_EQ(util::os::ReadFileIntoString(file, &content), 0);
  EXPECT_EQ(content, "1024");
}

TEST_F(OsTest, WriteLines) {
  std::filesystem::path file = m_dir_ / "devices.allow";
  std::ofstream(file) << "old content that is longer";

  ASSERT_EQ(util::os::WriteLinesToFile(file, {"c 1:3 mr", "b 8:* r"}), 0);

  std::string content;
  ASSERT_EQ(util::os::ReadFileIntoString(file, &content), 0);
  EXPECT_EQ(content, "c 1:3 mr\nb 8:* r\n");
}

TEST_F(OsTest, Folders) {
  std::filesystem::path nested = m_dir_ / "a" / "b" / "c";

  ASSERT_EQ(util::os::CreateFolders(nested), 0);
  EXPECT_TRUE(util::os::IsDirectory(nested));
  EXPECT_EQ(util::os::CreateFolders(nested), 0);

  std::vector<std::string> names;
  ASSERT_EQ(util::os::CreateFolders(m_dir_ / "a" / "a2"), 0);
  std::ofstream(m_dir_ / "a" / "file") << "x";
  ASSERT_EQ(util::os::ListSubFolders(m_dir_ / "a", &names), 0);
  EXPECT_EQ(names, (std::vector<std::string>{"a2", "b"}));

  EXPECT_EQ(util::os::RemoveFolder(m_dir_ / "a" / "b"), ENOTEMPTY);
  EXPECT_EQ(util::os::RemoveFolder(nested), 0);
  EXPECT_EQ(util::os::RemoveFolder(nested), ENOENT);
}

TEST_F(OsTest, ScopedFd) {
  std::filesystem::path file = m_dir_ / "tasks";
  std::ofstream(file) << "1\n";

  util::os::ScopedFd fd;
  EXPECT_FALSE(fd.Valid());
  ASSERT_EQ(util::os::OpenFile(file, O_RDONLY, &fd), 0);
  EXPECT_TRUE(fd.Valid());

  util::os::ScopedFd moved(std::move(fd));
  EXPECT_FALSE(fd.Valid());

  std::string content;
  ASSERT_EQ(util::os::ReadFdIntoString(moved.Get(), &content), 0);
  EXPECT_EQ(content, "1\n");

  EXPECT_EQ(util::os::OpenFile(m_dir_ / "missing", O_RDONLY, &fd), ENOENT);
}
