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

#include <cerrno>

#include "SharedTestImpl/FakeHierarchy.h"
#include "cgkit/Cpu.h"
#include "cgkit/Pids.h"

using namespace cgkit;

class SubsystemTest : public ::testing::Test {
 public:
  void SetUp() override { m_hierarchies_ = m_fake_.GetHierarchies(); }

 protected:
  std::unique_ptr<Subsystem> Make(SubsystemKind kind,
                                  std::string_view relative) {
    return MakeSubsystem(kind, CgroupPath(kind, relative), m_hierarchies_);
  }

  test::FakeHierarchy m_fake_;
  std::shared_ptr<const Hierarchies> m_hierarchies_;
};

TEST_F(SubsystemTest, CreateIsIdempotent) {
  auto pids = Make(SubsystemKind::PIDS, "job_1/step_0");
  EXPECT_FALSE(pids->Exists());

  ASSERT_TRUE(pids->Create().has_value());
  EXPECT_TRUE(pids->Exists());
  EXPECT_TRUE(std::filesystem::is_directory(
      m_fake_.Dir(SubsystemKind::PIDS, "job_1/step_0")));

  m_fake_.WriteControlFile(SubsystemKind::PIDS, "job_1/step_0", "pids.max",
                           "100\n");
  ASSERT_TRUE(pids->Create().has_value());
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::PIDS, "job_1/step_0",
                                    "pids.max"),
            "100\n");

  auto dir = pids->Directory();
  ASSERT_TRUE(dir.has_value());
  EXPECT_EQ(dir.value(), m_fake_.Dir(SubsystemKind::PIDS, "job_1/step_0"));
}

TEST_F(SubsystemTest, HandleKindFollowsClass) {
  CgroupPath path(SubsystemKind::MEMORY, "job_1");
  CpuSubsystem cpu(path, m_hierarchies_);

  EXPECT_EQ(cpu.Kind(), SubsystemKind::CPU);
  EXPECT_EQ(cpu.Path().Relative(), "job_1");
  EXPECT_EQ(MakeSubsystem(SubsystemKind::FREEZER, path, m_hierarchies_)->Kind(),
            SubsystemKind::FREEZER);
}

TEST_F(SubsystemTest, NotMounted) {
  Hierarchies h = Hierarchies::Standard(m_fake_.Root());
  h.Erase(SubsystemKind::CPU);
  CpuSubsystem cpu(CgroupPath(SubsystemKind::CPU, "job_1"),
                   std::make_shared<const Hierarchies>(h));

  auto created = cpu.Create();
  ASSERT_FALSE(created.has_value());
  EXPECT_EQ(created.error().code, CgErrCode::NOT_MOUNTED);

  auto shares = cpu.Shares();
  ASSERT_FALSE(shares.has_value());
  EXPECT_EQ(shares.error().code, CgErrCode::NOT_MOUNTED);
  EXPECT_FALSE(cpu.Exists());

  m_fake_.RemoveMountRoot(SubsystemKind::PIDS);
  auto pids = Make(SubsystemKind::PIDS, "job_1");
  created = pids->Create();
  ASSERT_FALSE(created.has_value());
  EXPECT_EQ(created.error().code, CgErrCode::NOT_MOUNTED);
  EXPECT_FALSE(std::filesystem::exists(m_fake_.Dir(SubsystemKind::PIDS)));
}

TEST_F(SubsystemTest, Delete) {
  auto cpu = Make(SubsystemKind::CPU, "job_1");
  ASSERT_TRUE(cpu->Create().has_value());
  ASSERT_TRUE(cpu->Delete().has_value());
  EXPECT_FALSE(cpu->Exists());

  auto again = cpu->Delete();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, CgErrCode::IO);
  EXPECT_EQ(again.error().sys_errno, ENOENT);

  m_fake_.MakeCgroup(SubsystemKind::CPU, "job_2");
  auto busy = Make(SubsystemKind::CPU, "job_2")->Delete();
  ASSERT_FALSE(busy.has_value());
  EXPECT_EQ(busy.error().code, CgErrCode::IO);
  GTEST_LOG_(INFO) << busy.error().ToString();
}

TEST_F(SubsystemTest, TasksAndProcs) {
  m_fake_.MakeCgroup(SubsystemKind::CPU, "job_1");
  auto cpu = Make(SubsystemKind::CPU, "job_1");

  auto tasks = cpu->Tasks();
  ASSERT_TRUE(tasks.has_value());
  EXPECT_TRUE(tasks->empty());

  m_fake_.WriteControlFile(SubsystemKind::CPU, "job_1", "tasks",
                           "301\n300\n302\n");
  tasks = cpu->Tasks();
  ASSERT_TRUE(tasks.has_value());
  EXPECT_EQ(tasks.value(),
            (std::vector<Pid>{Pid(301), Pid(300), Pid(302)}));

  m_fake_.WriteControlFile(SubsystemKind::CPU, "job_1", "cgroup.procs",
                           "300\nnot_a_pid\n");
  auto procs = cpu->Procs();
  ASSERT_FALSE(procs.has_value());
  EXPECT_EQ(procs.error().code, CgErrCode::PARSE);
  EXPECT_EQ(procs.error().file,
            (m_fake_.Dir(SubsystemKind::CPU, "job_1") / "cgroup.procs")
                .string());
}

TEST_F(SubsystemTest, AttachAndRemovePid) {
  m_fake_.MakeCgroup(SubsystemKind::PIDS, "");
  m_fake_.MakeCgroup(SubsystemKind::PIDS, "job_1");
  m_fake_.MakeCgroup(SubsystemKind::PIDS, "job_2");
  auto job_1 = Make(SubsystemKind::PIDS, "job_1");
  auto job_2 = Make(SubsystemKind::PIDS, "job_2");

  ASSERT_TRUE(job_1->AddTask(Pid(1234)).has_value());
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::PIDS, "job_1", "tasks"),
            "1234");

  ASSERT_TRUE(job_1->AddProc(Pid(1235)).has_value());
  EXPECT_EQ(
      m_fake_.ReadControlFile(SubsystemKind::PIDS, "job_1", "cgroup.procs"),
      "1235");

  ASSERT_TRUE(job_1->MoveProcTo(Pid(1235), *job_2).has_value());
  EXPECT_EQ(
      m_fake_.ReadControlFile(SubsystemKind::PIDS, "job_2", "cgroup.procs"),
      "1235");

  ASSERT_TRUE(job_2->RemoveProc(Pid(1235)).has_value());
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::PIDS, "", "cgroup.procs"),
            "1235");

  ASSERT_TRUE(job_1->RemoveTask(Pid(1234)).has_value());
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::PIDS, "", "tasks"), "1234");

  auto cpu = Make(SubsystemKind::CPU, "job_1");
  auto moved = job_1->MoveTaskTo(Pid(1), *cpu);
  ASSERT_FALSE(moved.has_value());
  EXPECT_EQ(moved.error().code, CgErrCode::INVALID_ARGUMENT);

  auto absent = Make(SubsystemKind::PIDS, "job_3")->AddTask(Pid(1));
  ASSERT_FALSE(absent.has_value());
  EXPECT_EQ(absent.error().code, CgErrCode::IO);
  EXPECT_EQ(absent.error().sys_errno, ENOENT);
}

TEST_F(SubsystemTest, Children) {
  m_fake_.MakeCgroup(SubsystemKind::MEMORY, "job_1/step_1");
  m_fake_.MakeCgroup(SubsystemKind::MEMORY, "job_1/step_0");

  auto children = Make(SubsystemKind::MEMORY, "job_1")->Children();
  ASSERT_TRUE(children.has_value());
  ASSERT_EQ(children->size(), 2U);
  EXPECT_EQ(children->at(0).Relative(), "job_1/step_0");
  EXPECT_EQ(children->at(1).Relative(), "job_1/step_1");
  EXPECT_EQ(children->at(1).Kind(), SubsystemKind::MEMORY);
}

TEST_F(SubsystemTest, CommonFlags) {
  m_fake_.MakeCgroup(SubsystemKind::CPUSET, "job_1");
  auto cpuset = Make(SubsystemKind::CPUSET, "job_1");

  ASSERT_TRUE(cpuset->SetNotifyOnRelease(true).has_value());
  EXPECT_EQ(cpuset->NotifyOnRelease(), true);
  ASSERT_TRUE(cpuset->SetCloneChildren(true).has_value());
  EXPECT_EQ(cpuset->CloneChildren(), true);
  ASSERT_TRUE(cpuset->SetCloneChildren(false).has_value());
  EXPECT_EQ(cpuset->CloneChildren(), false);
}

TEST_F(SubsystemTest, ReleaseAgentIsRootOnly) {
  m_fake_.MakeCgroup(SubsystemKind::MEMORY, "",
                     {{"release_agent", "/usr/bin/old\n"}});
  m_fake_.MakeCgroup(SubsystemKind::MEMORY, "job_1");

  auto job = Make(SubsystemKind::MEMORY, "job_1");
  auto agent = job->ReleaseAgent();
  ASSERT_FALSE(agent.has_value());
  EXPECT_EQ(agent.error().code, CgErrCode::INVALID_OPERATION);
  EXPECT_EQ(job->SetReleaseAgent("/bin/true").error().code,
            CgErrCode::INVALID_OPERATION);

  auto root = Make(SubsystemKind::MEMORY, "/");
  EXPECT_EQ(root->ReleaseAgent(), "/usr/bin/old");
  ASSERT_TRUE(root->SetReleaseAgent("/usr/libexec/cgkit-release").has_value());
  EXPECT_EQ(root->ReleaseAgent(), "/usr/libexec/cgkit-release");
}

TEST_F(SubsystemTest, RawFileAccess) {
  m_fake_.MakeCgroup(SubsystemKind::CPU, "job_1", {{"cpu.shares", "1024\n"}});
  auto cpu = Make(SubsystemKind::CPU, "job_1");

  EXPECT_TRUE(cpu->FileExists("cpu.shares"));
  EXPECT_FALSE(cpu->FileExists("cpu.weight"));
  EXPECT_EQ(cpu->ReadFile("cpu.shares"), "1024\n");

  ASSERT_TRUE(cpu->WriteFile("cpu.shares", "512").has_value());
  EXPECT_EQ(cpu->ReadFile("cpu.shares"), "512");

  auto fd = cpu->OpenFile("cpu.shares", O_RDONLY);
  ASSERT_TRUE(fd.has_value());
  EXPECT_TRUE(fd->Valid());

  auto missing = cpu->WriteFile("cpu.weight", "100");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().sys_errno, ENOENT);
}

TEST_F(SubsystemTest, EmptyRecordWritesNothing) {
  // No control file exists, any write would fail with ENOENT.
  m_fake_.MakeCgroup(SubsystemKind::CPU, "job_1");
  auto cpu = Make(SubsystemKind::CPU, "job_1");

  EXPECT_FALSE(cpu->Configured(Resources{}));
  EXPECT_TRUE(cpu->Apply(Resources{}).has_value());

  Resources empty{.cpu = CpuResources{}};
  EXPECT_TRUE(cpu->Configured(empty));
  EXPECT_TRUE(cpu->Apply(empty).has_value());
}

TEST_F(SubsystemTest, EmptyRecordsWriteNothingForEveryKind) {
  // Map and list fields are present but hold no entries.
  Resources empty{
      .cpu = CpuResources{},
      .cpuset = CpuSetResources{},
      .memory = MemoryResources{},
      .hugetlb = HugeTlbResources{},
      .devices =
          DevicesResources{.deny = std::vector<DeviceRule>{},
                           .allow = std::vector<DeviceRule>{}},
      .blkio =
          BlkIoResources{
              .weight_device = std::map<DeviceNumber, uint16_t>{},
              .leaf_weight_device = std::map<DeviceNumber, uint16_t>{},
              .read_bps_device = std::map<DeviceNumber, uint64_t>{},
              .write_bps_device = std::map<DeviceNumber, uint64_t>{},
              .read_iops_device = std::map<DeviceNumber, uint64_t>{},
              .write_iops_device = std::map<DeviceNumber, uint64_t>{}},
      .rdma = RdmaResources{.max = std::map<std::string, RdmaLimit>{}},
      .net_cls = NetClsResources{},
      .net_prio =
          NetPrioResources{.ifpriomap = std::map<std::string, uint32_t>{}},
      .pids = PidsResources{},
      .freezer = FreezerResources{}};

  for (SubsystemKind kind : ALL_SUBSYSTEM_FLAG.Kinds()) {
    std::string_view name = CgConstant::GetSubsystemStringView(kind);

    // Only the common files exist, so any write fails with ENOENT.
    m_fake_.MakeCgroup(kind, "job_1");
    auto handle = Make(kind, "job_1");

    bool has_knobs =
        kind != SubsystemKind::CPUACCT && kind != SubsystemKind::PERF_EVENT;
    EXPECT_EQ(handle->Configured(empty), has_knobs) << name;

    auto applied = handle->Apply(empty);
    EXPECT_TRUE(applied.has_value())
        << name << ": " << applied.error().ToString();

    size_t entries = 0;
    for ([[maybe_unused]] const auto &e :
         std::filesystem::directory_iterator(m_fake_.Dir(kind, "job_1")))
      ++entries;
    EXPECT_EQ(entries, 4U) << name;
    EXPECT_EQ(m_fake_.ReadControlFile(kind, "job_1", "notify_on_release"),
              "0\n")
        << name;
  }
}

TEST_F(SubsystemTest, FailedWriteReportsCommitted) {
  m_fake_.MakeCgroup(SubsystemKind::CPU, "job_1",
                     {{"cpu.shares", "1024"}, {"cpu.cfs_period_us", "100000"}});
  auto cpu = Make(SubsystemKind::CPU, "job_1");

  Resources res{.cpu = CpuResources{.shares = 2048,
                                    .cfs_period_us = 50000,
                                    .cfs_quota_us = 25000}};
  auto applied = cpu->Apply(res);
  ASSERT_FALSE(applied.has_value());

  const CgError &err = applied.error();
  GTEST_LOG_(INFO) << err.ToString();
  EXPECT_EQ(err.code, CgErrCode::IO);
  EXPECT_EQ(err.sys_errno, ENOENT);
  EXPECT_EQ(err.file,
            (m_fake_.Dir(SubsystemKind::CPU, "job_1") / "cpu.cfs_quota_us")
                .string());
  EXPECT_EQ(err.committed,
            (std::vector<std::string>{"cpu.shares", "cpu.cfs_period_us"}));

  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPU, "job_1", "cpu.shares"),
            "2048");
}
