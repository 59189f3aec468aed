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

#include "cgkit/CgroupPath.h"
#include "cgkit/Hierarchies.h"

using namespace cgkit;

TEST(CgroupPath, Normalize) {
  CgroupPath path(SubsystemKind::MEMORY, "/job_1//step_0/./");
  EXPECT_EQ(path.Relative(), "job_1/step_0");
  EXPECT_EQ(path.Kind(), SubsystemKind::MEMORY);
  EXPECT_FALSE(path.IsRoot());
  EXPECT_EQ(fmt::format("{}", path), "memory:/job_1/step_0");

  EXPECT_TRUE(CgroupPath(SubsystemKind::CPU, "").IsRoot());
  EXPECT_TRUE(CgroupPath(SubsystemKind::CPU, "/").IsRoot());
}

TEST(CgroupPath, RejectParentSegment) {
  auto path = CgroupPath::Make(SubsystemKind::CPU, "job_1/../../etc");
  ASSERT_FALSE(path.has_value());
  EXPECT_EQ(path.error().code, CgErrCode::INVALID_ARGUMENT);
  GTEST_LOG_(INFO) << path.error().ToString();

  auto ok = CgroupPath::Make(SubsystemKind::CPU, "job..1");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->Relative(), "job..1");
}

TEST(CgroupPath, JoinAndParent) {
  CgroupPath root(SubsystemKind::PIDS, "");

  auto job = root.Join("job_1");
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->Relative(), "job_1");

  auto step = job->Join("step_0");
  ASSERT_TRUE(step.has_value());
  EXPECT_EQ(step->Relative(), "job_1/step_0");
  EXPECT_EQ(step->Parent(), job.value());
  EXPECT_EQ(job->Parent(), root);
  EXPECT_EQ(root.Parent(), root);

  EXPECT_FALSE(job->Join("..").has_value());

  CgroupPath other = step->WithKind(SubsystemKind::FREEZER);
  EXPECT_EQ(other.Kind(), SubsystemKind::FREEZER);
  EXPECT_EQ(other.Relative(), step->Relative());
}

TEST(CgroupPath, Resolve) {
  Hierarchies h = Hierarchies::Standard("/sys/fs/cgroup");

  EXPECT_EQ(h.Resolve(CgroupPath(SubsystemKind::CPUSET, "a/b")),
            std::filesystem::path("/sys/fs/cgroup/cpuset/a/b"));
  EXPECT_EQ(h.Resolve(CgroupPath(SubsystemKind::NET_CLS, "")),
            std::filesystem::path("/sys/fs/cgroup/net_cls"));

  h.Erase(SubsystemKind::RDMA);
  EXPECT_FALSE(h.Resolve(CgroupPath(SubsystemKind::RDMA, "a")).has_value());
}
