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

#include <cerrno>

#include "cgkit/CgroupError.h"
#include "cgkit/Resources.h"

using namespace cgkit;

TEST(Resources, MaxValue) {
  EXPECT_EQ(MaxValue::Parse("max\n"), MaxValue::Max());
  EXPECT_EQ(MaxValue::Parse(" 42 "), MaxValue::Of(42));
  EXPECT_FALSE(MaxValue::Parse("-1").has_value());
  EXPECT_FALSE(MaxValue::Parse("").has_value());

  EXPECT_EQ(MaxValue::Max().ToString(), "max");
  EXPECT_EQ(MaxValue::Of(0).ToString(), "0");
  EXPECT_TRUE(MaxValue::Max().IsMax());
  EXPECT_EQ(MaxValue::Of(7).Value(), 7U);
}

TEST(Resources, DeviceRuleParse) {
  auto rule = DeviceRule::Parse("c 1:3 mr");
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->type, DeviceType::CHAR);
  EXPECT_EQ(rule->major, 1U);
  EXPECT_EQ(rule->minor, 3U);
  EXPECT_TRUE(rule->access.Contains(DevicePermission::MKNOD));
  EXPECT_TRUE(rule->access.Contains(DevicePermission::READ));
  EXPECT_FALSE(rule->access.Contains(DevicePermission::WRITE));
  EXPECT_EQ(rule->ToString(), "c 1:3 mr");

  auto all = DeviceRule::Parse("a");
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->type, DeviceType::ALL);
  EXPECT_FALSE(all->major.has_value());
  EXPECT_EQ(all->access, DeviceAccess::All());
  EXPECT_EQ(all->ToString(), "a *:* rwm");

  auto block = DeviceRule::Parse("b 8:* rw");
  ASSERT_TRUE(block.has_value());
  EXPECT_EQ(block->major, 8U);
  EXPECT_FALSE(block->minor.has_value());
  EXPECT_EQ(block->ToString(), "b 8:* rw");
}

TEST(Resources, DeviceRuleRejects) {
  for (std::string_view s :
       {"", "x 1:3 r", "c", "c 1:3", "c 1:3 rx", "c 1:3 rr", "c 1 r",
        "c a:3 r", "c 1:3 r extra"}) {
    auto rule = DeviceRule::Parse(s);
    EXPECT_FALSE(rule.has_value()) << s;
    if (!rule)
      EXPECT_EQ(rule.error().code, CgErrCode::INVALID_ARGUMENT) << s;
  }
}

TEST(Resources, DeviceAccessEquality) {
  auto mr = DeviceAccess::Parse("mr");
  auto rm = DeviceAccess::Parse("rm");
  ASSERT_TRUE(mr && rm);
  EXPECT_EQ(mr.value(), rm.value());
  EXPECT_EQ(mr->ToString(), "mr");
  EXPECT_EQ(rm->ToString(), "rm");
  EXPECT_FALSE(DeviceAccess::Parse("").has_value());
}

TEST(Resources, HugeTlbLimit) {
  EXPECT_EQ(HugeTlbLimit::Bytes(4096).ToFileValue(HugepageSize::MB_2), "4096");
  EXPECT_EQ(HugeTlbLimit::Pages(3).ToFileValue(HugepageSize::MB_2),
            fmt::format("{}", 3 * kHugepage2MbBytes));
  EXPECT_EQ(HugeTlbLimit::Pages(2).ToFileValue(HugepageSize::GB_1),
            "2147483648");
  EXPECT_EQ(HugeTlbLimit::Unlimited().ToFileValue(HugepageSize::GB_1), "-1");
}

TEST(Resources, FreezerState) {
  EXPECT_EQ(ParseFreezerState("FROZEN\n"), FreezerState::FROZEN);
  EXPECT_EQ(ParseFreezerState("THAWED"), FreezerState::THAWED);
  EXPECT_EQ(ParseFreezerState("FREEZING"), FreezerState::FREEZING);
  EXPECT_FALSE(ParseFreezerState("frozen").has_value());
  EXPECT_EQ(FreezerStateStr(FreezerState::FROZEN), "FROZEN");
}

TEST(Resources, ClassId) {
  EXPECT_EQ(MakeClassId(0x10, 0x1), 0x100001U);
  EXPECT_EQ(MakeClassId(0xFFFF, 0xFFFF), 0xFFFFFFFFU);
}

TEST(Resources, SubsystemFlags) {
  SubsystemFlags flags = SubsystemKind::CPU | SubsystemKind::MEMORY;
  flags |= SubsystemKind::PIDS;

  EXPECT_TRUE(flags.Contains(SubsystemKind::MEMORY));
  EXPECT_FALSE(flags.Contains(SubsystemKind::CPUSET));
  EXPECT_EQ(flags.Kinds(),
            (std::vector<SubsystemKind>{SubsystemKind::CPU,
                                        SubsystemKind::MEMORY,
                                        SubsystemKind::PIDS}));
  EXPECT_TRUE(NO_SUBSYSTEM_FLAG.Empty());
  EXPECT_EQ(ALL_SUBSYSTEM_FLAG.Kinds().size(), kSubsystemCount);
  EXPECT_EQ(CgConstant::ParseSubsystemKind("net_prio"),
            SubsystemKind::NET_PRIO);
  EXPECT_FALSE(CgConstant::ParseSubsystemKind("cpu,cpuacct").has_value());
}

TEST(Resources, Pid) {
  Pid self = Pid::Self();
  EXPECT_EQ(self.Raw(), getpid());
  EXPECT_EQ(static_cast<pid_t>(Pid(42)), 42);
  EXPECT_LT(Pid(3), Pid(4));
  EXPECT_EQ(fmt::format("{}", Pid(42)), "42");
}

TEST(Resources, ErrorToString) {
  CgError err = MakeIoErr(EBUSY, "/sys/fs/cgroup/cpu/job_1", "remove");
  EXPECT_EQ(err.code, CgErrCode::IO);
  EXPECT_EQ(err.sys_errno, EBUSY);
  EXPECT_EQ(err.file, "/sys/fs/cgroup/cpu/job_1");

  err.committed = {"cpu.shares"};
  std::string s = err.ToString();
  GTEST_LOG_(INFO) << s;
  EXPECT_NE(s.find("cpu.shares"), std::string::npos);
  EXPECT_NE(s.find("errno"), std::string::npos);
}
