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

#include "SharedTestImpl/FakeHierarchy.h"
#include "cgkit/Builder.h"
#include "cgkit/Cpu.h"
#include "cgkit/CpuSet.h"
#include "cgkit/Memory.h"

using namespace cgkit;

class BuilderTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_hierarchies_ = m_fake_.GetHierarchies();

    // Control files the kernel would create along with the directories.
    m_fake_.MakeCgroup(SubsystemKind::CPU, "job_1",
                       {{"cpu.shares", "1024\n"},
                        {"cpu.cfs_period_us", "100000\n"},
                        {"cpu.cfs_quota_us", "-1\n"}});
    m_fake_.MakeCgroup(SubsystemKind::CPUSET, "job_1",
                       {{"cpuset.cpus", "\n"}, {"cpuset.mems", "\n"}});
  }

 protected:
  test::FakeHierarchy m_fake_;
  std::shared_ptr<const Hierarchies> m_hierarchies_;
};

TEST_F(BuilderTest, CpuAndCpuSet) {
  auto cg = Builder("job_1", m_hierarchies_)
                .Cpu()
                .Shares(1000)
                .CfsQuotaUs(500000)
                .CfsPeriodUs(1000000)
                .Done()
                .CpuSet()
                .Cpus({0})
                .Done()
                .Build();
  ASSERT_TRUE(cg.has_value()) << cg.error().ToString();

  EXPECT_EQ(cg->Kinds(), SubsystemKind::CPU | SubsystemKind::CPUSET);
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPU, "job_1", "cpu.shares"),
            "1000");
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPU, "job_1",
                                    "cpu.cfs_quota_us"),
            "500000");
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPU, "job_1",
                                    "cpu.cfs_period_us"),
            "1000000");
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPUSET, "job_1",
                                    "cpuset.cpus"),
            "0");
  // Not configured, left alone.
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::CPUSET, "job_1",
                                    "cpuset.mems"),
            "\n");

  EXPECT_EQ(cg->Get<CpuSubsystem>()->Shares(), 1000U);
  EXPECT_EQ(cg->Get<CpuSetSubsystem>()->Cpus(), (std::set<uint32_t>{0}));
}

TEST_F(BuilderTest, ReenterSubBuilder) {
  Builder builder = Builder("job_1", m_hierarchies_)
                        .Cpu()
                        .Shares(100)
                        .Done()
                        .Cpu()
                        .CfsPeriodUs(50000)
                        .Done();

  const auto &cpu = builder.GetResources().cpu;
  ASSERT_TRUE(cpu.has_value());
  EXPECT_EQ(cpu->shares, 100U);
  EXPECT_EQ(cpu->cfs_period_us, 50000U);
  EXPECT_FALSE(cpu->cfs_quota_us.has_value());
  EXPECT_EQ(builder.Kinds(), SubsystemFlags(SubsystemKind::CPU));

  auto cg = std::move(builder).Build();
  ASSERT_TRUE(cg.has_value()) << cg.error().ToString();
  EXPECT_EQ(cg->Get<CpuSubsystem>()->CfsPeriodUs(), 50000U);
}

TEST_F(BuilderTest, InvalidValue) {
  auto cg = Builder("job_2", m_hierarchies_)
                .Cpu()
                .Shares(1)
                .Done()
                .Memory()
                .Swappiness(500)
                .Done()
                .Build();
  ASSERT_FALSE(cg.has_value());
  EXPECT_EQ(cg.error().code, CgErrCode::INVALID_ARGUMENT);
  // The first rejected value wins.
  EXPECT_NE(cg.error().description.find("shares"), std::string::npos);

  // Nothing touched the file system.
  EXPECT_FALSE(
      std::filesystem::exists(m_fake_.Dir(SubsystemKind::CPU, "job_2")));
  EXPECT_FALSE(
      std::filesystem::exists(m_fake_.Dir(SubsystemKind::MEMORY, "job_2")));
}

TEST_F(BuilderTest, NoSubsystem) {
  auto cg = Builder("job_1", m_hierarchies_).Build();
  ASSERT_FALSE(cg.has_value());
  EXPECT_EQ(cg.error().code, CgErrCode::INVALID_ARGUMENT);
}

TEST_F(BuilderTest, ParentSegment) {
  auto cg = Builder("../job_1", m_hierarchies_).Pids().Done().Build();
  ASSERT_FALSE(cg.has_value());
  EXPECT_EQ(cg.error().code, CgErrCode::INVALID_ARGUMENT);
}

TEST_F(BuilderTest, ReportsFirstFailingSubsystem) {
  // The memory hierarchy has no control files, so the limit write fails.
  auto cg = Builder("job_3", m_hierarchies_)
                .CpuAcct()
                .Memory()
                .LimitInBytes(1 << 20)
                .Done()
                .Build();
  ASSERT_FALSE(cg.has_value());
  EXPECT_EQ(cg.error().code, CgErrCode::IO);
  EXPECT_EQ(cg.error().description.rfind("[memory] ", 0), 0U);

  // Created before the failure and left in place.
  EXPECT_TRUE(std::filesystem::is_directory(
      m_fake_.Dir(SubsystemKind::CPUACCT, "job_3")));
  EXPECT_TRUE(std::filesystem::is_directory(
      m_fake_.Dir(SubsystemKind::MEMORY, "job_3")));
}

TEST_F(BuilderTest, RecordsEveryController) {
  Builder builder =
      Builder("job_4", m_hierarchies_)
          .Devices()
          .Deny(DeviceRule::Parse("a").value())
          .Allow(DeviceRule::Parse("c 1:3 rwm").value())
          .Done()
          .BlkIo()
          .Weight(100)
          .ReadBpsDevice({8, 0}, 1048576)
          .Done()
          .HugeTlb()
          .Limit(HugepageSize::MB_2, HugeTlbLimit::Pages(8))
          .Done()
          .Rdma()
          .Max("mlx4_0", RdmaLimit{.hca_handle = MaxValue::Of(2)})
          .Done()
          .NetCls()
          .ClassId(0x10, 0x1)
          .Done()
          .NetPrio()
          .IfPrio("eth0", 5)
          .Done()
          .Pids()
          .Max(MaxValue::Of(64))
          .Done()
          .Freezer()
          .State(FreezerState::THAWED)
          .Done()
          .PerfEvent();

  const Resources &res = builder.GetResources();
  ASSERT_TRUE(res.devices.has_value());
  EXPECT_EQ(res.devices->deny->size(), 1U);
  EXPECT_EQ(res.devices->allow->at(0).ToString(), "c 1:3 rwm");
  EXPECT_EQ(res.blkio->weight, 100U);
  EXPECT_EQ(res.blkio->read_bps_device->at(DeviceNumber{8, 0}), 1048576U);
  EXPECT_EQ(res.hugetlb->limit_2mb, HugeTlbLimit::Pages(8));
  EXPECT_FALSE(res.hugetlb->limit_1gb.has_value());
  EXPECT_EQ(res.rdma->max->at("mlx4_0").hca_handle, MaxValue::Of(2));
  EXPECT_EQ(res.net_cls->classid, 0x100001U);
  EXPECT_EQ(res.net_prio->ifpriomap->at("eth0"), 5U);
  EXPECT_EQ(res.pids->max, MaxValue::Of(64));
  EXPECT_EQ(res.freezer->state, FreezerState::THAWED);
  EXPECT_FALSE(res.cpu.has_value());

  SubsystemFlags kinds = builder.Kinds();
  for (SubsystemKind kind :
       {SubsystemKind::DEVICES, SubsystemKind::BLKIO, SubsystemKind::HUGETLB,
        SubsystemKind::RDMA, SubsystemKind::NET_CLS, SubsystemKind::NET_PRIO,
        SubsystemKind::PIDS, SubsystemKind::FREEZER,
        SubsystemKind::PERF_EVENT})
    EXPECT_TRUE(kinds.Contains(kind))
        << CgConstant::GetSubsystemStringView(kind);
  EXPECT_FALSE(kinds.Contains(SubsystemKind::MEMORY));
}

TEST_F(BuilderTest, RejectsFreezingAndBadNames) {
  auto freezing = Builder("job_5", m_hierarchies_)
                      .Freezer()
                      .State(FreezerState::FREEZING)
                      .Done()
                      .Build();
  ASSERT_FALSE(freezing.has_value());
  EXPECT_EQ(freezing.error().code, CgErrCode::INVALID_ARGUMENT);

  auto iface = Builder("job_5", m_hierarchies_)
                   .NetPrio()
                   .IfPrio("eth 0", 1)
                   .Done()
                   .Build();
  ASSERT_FALSE(iface.has_value());
  EXPECT_EQ(iface.error().code, CgErrCode::INVALID_ARGUMENT);

  auto weight = Builder("job_5", m_hierarchies_)
                    .BlkIo()
                    .WeightDevice({8, 0}, 5)
                    .Done()
                    .Build();
  ASSERT_FALSE(weight.has_value());
  EXPECT_EQ(weight.error().code, CgErrCode::INVALID_ARGUMENT);

  auto hugetlb = Builder("job_5", m_hierarchies_)
                     .HugeTlb()
                     .Limit(HugepageSize::GB_1, HugeTlbLimit::Pages(1ULL << 34))
                     .Done()
                     .Build();
  ASSERT_FALSE(hugetlb.has_value());
  EXPECT_EQ(hugetlb.error().code, CgErrCode::INVALID_ARGUMENT);
  EXPECT_FALSE(
      std::filesystem::exists(m_fake_.Dir(SubsystemKind::HUGETLB, "job_5")));

  EXPECT_FALSE(
      std::filesystem::exists(m_fake_.Dir(SubsystemKind::FREEZER, "job_5")));
}
