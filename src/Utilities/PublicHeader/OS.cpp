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

#include "cgkit/OS.h"

#include <sys/types.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include "cgkit/Logger.h"

#if defined(__linux__) || defined(__unix__)
#  include <dirent.h>
#elif defined(_WIN32)
#  error "Win32 Platform is not supported now!"
#else
#  error "Unsupported OS"
#endif

namespace cgkit::util::os {

int OpenFile(const std::filesystem::path &p, int flags, ScopedFd *fd) {
  int raw;
  do {
    raw = open(p.c_str(), flags | O_CLOEXEC);
  } while (raw == -1 && errno == EINTR);

  if (raw == -1) return errno;

  *fd = ScopedFd(raw);
  return 0;
}

int ReadFdIntoString(int fd, std::string *content) {
  content->clear();

  std::array<char, 4096> buf{};
  while (true) {
    ssize_t n = read(fd, buf.data(), buf.size());
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno;
    }
    content->append(buf.data(), static_cast<size_t>(n));
  }

  return 0;
}

int ReadFileIntoString(const std::filesystem::path &p, std::string *content) {
  ScopedFd fd;
  int err = OpenFile(p, O_RDONLY, &fd);
  if (err != 0) return err;

  return ReadFdIntoString(fd.Get(), content);
}

int WriteStringToFd(int fd, std::string_view content) {
  ssize_t n;
  do {
    n = write(fd, content.data(), content.size());
  } while (n == -1 && errno == EINTR);

  if (n < 0) return errno;
  if (static_cast<size_t>(n) != content.size()) return EIO;
  return 0;
}

int WriteStringToFile(const std::filesystem::path &p,
                      std::string_view content) {
  ScopedFd fd;
  int err = OpenFile(p, O_WRONLY | O_TRUNC, &fd);
  if (err != 0) return err;

  return WriteStringToFd(fd.Get(), content);
}

int WriteLinesToFile(const std::filesystem::path &p,
                     const std::vector<std::string> &lines) {
  ScopedFd fd;
  int err = OpenFile(p, O_WRONLY | O_TRUNC, &fd);
  if (err != 0) return err;

  for (const auto &line : lines) {
    std::string buf = line + '\n';
    err = WriteStringToFd(fd.Get(), buf);
    if (err != 0) return err;
  }

  return 0;
}

int CreateFolders(const std::filesystem::path &p, mode_t mode) {
  if (IsDirectory(p)) return 0;

  std::filesystem::path parent = p.parent_path();
  if (!parent.empty() && parent != p && !IsDirectory(parent)) {
    int err = CreateFolders(parent, mode);
    if (err != 0) return err;
  }

  if (mkdir(p.c_str(), mode) == 0) return 0;

  int err = errno;
  if (err == EEXIST) return IsDirectory(p) ? 0 : ENOTDIR;
  return err;
}

int RemoveFolder(const std::filesystem::path &p) {
  if (rmdir(p.c_str()) == 0) return 0;
  return errno;
}

bool IsDirectory(const std::filesystem::path &p) {
  struct stat st{};
  return stat(p.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool FileExists(const std::filesystem::path &p) {
  struct stat st{};
  return stat(p.c_str(), &st) == 0;
}

int ListSubFolders(const std::filesystem::path &p,
                   std::vector<std::string> *names) {
  names->clear();

  DIR *dir = opendir(p.c_str());
  if (dir == nullptr) return errno;

  errno = 0;
  struct dirent *entry;
  while ((entry = readdir(dir)) != nullptr) {
    std::string_view name = entry->d_name;
    if (name == "." || name == "..") continue;
    if (IsDirectory(p / name)) names->emplace_back(name);
  }

  int err = errno;
  closedir(dir);
  if (err != 0) {
    CGKIT_ERROR("Failed to list folder {}: {}", p.string(), std::strerror(err));
    return err;
  }

  std::sort(names->begin(), names->end());
  return 0;
}

}  // namespace cgkit::util::os
