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
#include "cgkit/Freezer.h"
#include "cgkit/PerfEvent.h"
#include "cgkit/Pids.h"

using namespace cgkit;

TEST(Pids, MaxAndCounters) {
  test::FakeHierarchy fake;
  fake.MakeCgroup(SubsystemKind::PIDS, "job_1",
                  {{"pids.max", "max\n"},
                   {"pids.current", "7\n"},
                   {"pids.events", "max 2\n"}});
  PidsSubsystem pids(CgroupPath(SubsystemKind::PIDS, "job_1"),
                     fake.GetHierarchies());

  EXPECT_EQ(pids.Max(), MaxValue::Max());
  EXPECT_EQ(pids.Current(), 7U);

  auto events = pids.Events();
  ASSERT_TRUE(events.has_value());
  EXPECT_EQ(events->max, 2U);

  ASSERT_TRUE(pids.SetMax(MaxValue::Of(128)).has_value());
  EXPECT_EQ(fake.ReadControlFile(SubsystemKind::PIDS, "job_1", "pids.max"),
            "128");
  EXPECT_EQ(pids.Max(), MaxValue::Of(128));

  ASSERT_TRUE(
      pids.Apply(Resources{.pids = PidsResources{.max = MaxValue::Max()}})
          .has_value());
  EXPECT_EQ(pids.Max(), MaxValue::Max());

  fake.WriteControlFile(SubsystemKind::PIDS, "job_1", "pids.max", "-5\n");
  EXPECT_EQ(pids.Max().error().code, CgErrCode::PARSE);

  fake.WriteControlFile(SubsystemKind::PIDS, "job_1", "pids.events", "\n");
  EXPECT_EQ(pids.Events().error().code, CgErrCode::PARSE);
}

class FreezerTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_fake_.MakeCgroup(SubsystemKind::FREEZER, "job_1",
                       {{"freezer.state", "THAWED\n"},
                        {"freezer.self_freezing", "0\n"},
                        {"freezer.parent_freezing", "0\n"}});
    m_freezer_ = std::make_unique<FreezerSubsystem>(
        CgroupPath(SubsystemKind::FREEZER, "job_1"), m_fake_.GetHierarchies());
  }

 protected:
  test::FakeHierarchy m_fake_;
  std::unique_ptr<FreezerSubsystem> m_freezer_;
};

TEST_F(FreezerTest, FreezeAndThaw) {
  EXPECT_EQ(m_freezer_->State(), FreezerState::THAWED);
  EXPECT_EQ(m_freezer_->SelfFreezing(), false);
  EXPECT_EQ(m_freezer_->ParentFreezing(), false);

  ASSERT_TRUE(m_freezer_->Freeze().has_value());
  EXPECT_EQ(m_fake_.ReadControlFile(SubsystemKind::FREEZER, "job_1",
                                    "freezer.state"),
            "FROZEN");
  EXPECT_EQ(m_freezer_->State(), FreezerState::FROZEN);

  ASSERT_TRUE(m_freezer_->Thaw().has_value());
  EXPECT_EQ(m_freezer_->State(), FreezerState::THAWED);

  // The kernel reports FREEZING while tasks are still being stopped.
  m_fake_.WriteControlFile(SubsystemKind::FREEZER, "job_1", "freezer.state",
                           "FREEZING\n");
  EXPECT_EQ(m_freezer_->State(), FreezerState::FREEZING);
}

TEST_F(FreezerTest, RejectFreezing) {
  auto rejected = m_freezer_->Apply(Resources{
      .freezer = FreezerResources{.state = FreezerState::FREEZING}});
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().code, CgErrCode::INVALID_ARGUMENT);
  EXPECT_EQ(m_freezer_->State(), FreezerState::THAWED);

  m_fake_.WriteControlFile(SubsystemKind::FREEZER, "job_1", "freezer.state",
                           "STOPPED\n");
  EXPECT_EQ(m_freezer_->State().error().code, CgErrCode::PARSE);
}

TEST(PerfEvent, NothingToConfigure) {
  test::FakeHierarchy fake;
  fake.MakeCgroup(SubsystemKind::PERF_EVENT, "job_1");
  PerfEventSubsystem perf(CgroupPath(SubsystemKind::PERF_EVENT, "job_1"),
                          fake.GetHierarchies());

  EXPECT_FALSE(perf.Configured(Resources{}));
  EXPECT_TRUE(perf.Apply(Resources{}).has_value());
  ASSERT_TRUE(perf.AddTask(Pid(42)).has_value());
  EXPECT_EQ(perf.Tasks(), std::vector<Pid>{Pid(42)});
}
