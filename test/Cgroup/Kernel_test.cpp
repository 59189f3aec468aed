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
#include <unistd.h>

#include <algorithm>

#include "SharedTestImpl/GlobalDefs.h"
#include "cgkit/Builder.h"
#include "cgkit/Cpu.h"
#include "cgkit/Memory.h"
#include "cgkit/OS.h"
#include "cgkit/String.h"

using namespace cgkit;

// Runs against the cgroup v1 hierarchy of this host. Needs root.
class KernelTest : public ::testing::Test {
 public:
  void SetUp() override {
    if (geteuid() != 0) GTEST_SKIP() << "Needs root";

    m_hierarchies_ =
        std::make_shared<const Hierarchies>(Hierarchies::Standard());
    for (SubsystemKind kind : {SubsystemKind::CPU, SubsystemKind::MEMORY}) {
      if (!util::os::IsDirectory(m_hierarchies_->MountRoot(kind).value()))
        GTEST_SKIP() << CgConstant::GetSubsystemStringView(kind)
                     << " is not mounted as a cgroup v1 hierarchy";
    }

    m_relative_ = fmt::format("cgkit_test_{}", getpid());
    g_cgroup_root_mutex.Lock();
    m_locked_ = true;
  }

  void TearDown() override {
    if (!m_locked_) return;

    Cgroup cg(SubsystemKind::CPU | SubsystemKind::MEMORY, m_relative_,
              m_hierarchies_);
    auto back = cg.RemoveProc(Pid::Self());
    EXPECT_TRUE(back.has_value()) << back.error().ToString();
    auto removed = cg.Delete();
    EXPECT_TRUE(removed.has_value()) << removed.error().ToString();
    g_cgroup_root_mutex.Unlock();
  }

 protected:
  std::shared_ptr<const Hierarchies> m_hierarchies_;
  std::string m_relative_;
  bool m_locked_{false};
};

TEST_F(KernelTest, BuildAttachAndDelete) {
  auto cg = Builder(m_relative_, m_hierarchies_)
                .Cpu()
                .Shares(512)
                .CfsPeriodUs(100000)
                .CfsQuotaUs(50000)
                .Done()
                .Memory()
                .LimitInBytes(256LL << 20)
                .Done()
                .Build();
  ASSERT_TRUE(cg.has_value()) << cg.error().ToString();

  EXPECT_EQ(cg->Get<CpuSubsystem>()->Shares(), 512U);
  EXPECT_EQ(cg->Get<CpuSubsystem>()->CfsQuotaUs(), 50000);
  EXPECT_EQ(cg->Get<MemorySubsystem>()->LimitInBytes(), 256ULL << 20);

  Pid self = Pid::Self();
  ASSERT_TRUE(cg->AddProc(self).has_value());

  auto procs = cg->Procs();
  ASSERT_TRUE(procs.has_value()) << procs.error().ToString();
  EXPECT_TRUE(std::ranges::find(procs.value(), self) != procs->end());

  // A populated cgroup can't be removed.
  auto busy = cg->Delete();
  EXPECT_FALSE(busy.has_value());

  ASSERT_TRUE(cg->RemoveProc(self).has_value());
  procs = cg->Procs();
  ASSERT_TRUE(procs.has_value());
  EXPECT_TRUE(procs->empty());
}

TEST_F(KernelTest, ReadOnlyStatistics) {
  MemorySubsystem root(CgroupPath(SubsystemKind::MEMORY, ""), m_hierarchies_);

  auto stat = root.Stat();
  ASSERT_TRUE(stat.has_value()) << stat.error().ToString();
  EXPECT_FALSE(stat->raw.empty());

  auto usage = root.UsageInBytes();
  ASSERT_TRUE(usage.has_value()) << usage.error().ToString();
  GTEST_LOG_(INFO) << "Root memory usage: " << util::ReadableMemory(*usage);

  auto children = root.Children();
  ASSERT_TRUE(children.has_value());
}
