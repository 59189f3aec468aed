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

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cgkit::util::os {

/**
 * Owns a file descriptor and closes it on destruction. Move only.
 */
class ScopedFd {
 public:
  ScopedFd() noexcept : fd_(-1) {}
  explicit ScopedFd(int fd) noexcept : fd_(fd) {}

  ~ScopedFd() noexcept { Reset(); }

  ScopedFd(ScopedFd const &) = delete;
  ScopedFd &operator=(ScopedFd const &) = delete;

  ScopedFd(ScopedFd &&val) noexcept : fd_(val.fd_) { val.fd_ = -1; }

  ScopedFd &operator=(ScopedFd &&val) noexcept {
    if (this != &val) {
      Reset();
      fd_ = val.fd_;
      val.fd_ = -1;
    }
    return *this;
  }

  int Get() const noexcept { return fd_; }
  bool Valid() const noexcept { return fd_ >= 0; }

  int Release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset() noexcept {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

// All functions below return 0 on success and an errno value on failure.

int OpenFile(const std::filesystem::path &p, int flags, ScopedFd *fd);

int ReadFdIntoString(int fd, std::string *content);

int ReadFileIntoString(const std::filesystem::path &p, std::string *content);

// One write(2) call for the whole buffer. A short write is reported as EIO.
int WriteStringToFd(int fd, std::string_view content);

// Opens p with O_WRONLY | O_TRUNC (never O_CREAT) and issues one write(2).
int WriteStringToFile(const std::filesystem::path &p, std::string_view content);

// Opens p once and issues one write(2) per line, each terminated with '\n'.
// Kernel control files parse every write(2) separately.
int WriteLinesToFile(const std::filesystem::path &p,
                     const std::vector<std::string> &lines);

// mkdir -p. An existing directory at p is success, an existing
// non-directory is ENOTDIR.
int CreateFolders(const std::filesystem::path &p, mode_t mode = 0755);

// rmdir(2), no recursion.
int RemoveFolder(const std::filesystem::path &p);

bool IsDirectory(const std::filesystem::path &p);

bool FileExists(const std::filesystem::path &p);

int ListSubFolders(const std::filesystem::path &p,
                   std::vector<std::string> *names);

}  // namespace cgkit::util::os
