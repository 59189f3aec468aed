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

#include <set>

#include "cgkit/String.h"

using namespace cgkit;

TEST(String, ParseIdList) {
  std::set<uint32_t> ids;

  ASSERT_TRUE(util::ParseIdList("0-2,4,7-8\n", &ids));
  EXPECT_EQ(ids, (std::set<uint32_t>{0, 1, 2, 4, 7, 8}));

  ASSERT_TRUE(util::ParseIdList("", &ids));
  EXPECT_TRUE(ids.empty());

  EXPECT_FALSE(util::ParseIdList("3-1", &ids));
  EXPECT_FALSE(util::ParseIdList("1,,2", &ids));
  EXPECT_FALSE(util::ParseIdList("a-b", &ids));
  EXPECT_FALSE(util::ParseIdList("1-2-3", &ids));
}

TEST(String, FormatIdList) {
  EXPECT_EQ(util::FormatIdList({}), "");
  EXPECT_EQ(util::FormatIdList({0}), "0");
  EXPECT_EQ(util::FormatIdList({0, 1, 2, 4, 7, 8}), "0-2,4,7-8");

  std::set<uint32_t> ids;
  ASSERT_TRUE(util::ParseIdList(util::FormatIdList({3, 5, 6, 10}), &ids));
  EXPECT_EQ(ids, (std::set<uint32_t>{3, 5, 6, 10}));
}

TEST(String, ConvertNumbers) {
  int64_t i;
  ASSERT_TRUE(util::ConvertStringToInt64(" -1\n", &i));
  EXPECT_EQ(i, -1);
  EXPECT_FALSE(util::ConvertStringToInt64("", &i));
  EXPECT_FALSE(util::ConvertStringToInt64("12abc", &i));

  uint64_t u;
  ASSERT_TRUE(util::ConvertStringToUint64("9223372036854771712\n", &u));
  EXPECT_EQ(u, 9223372036854771712ULL);
  EXPECT_FALSE(util::ConvertStringToUint64("-1", &u));
  EXPECT_FALSE(util::ConvertStringToUint64("max", &u));

  bool b;
  ASSERT_TRUE(util::ConvertStringToBool01("1\n", &b));
  EXPECT_TRUE(b);
  ASSERT_TRUE(util::ConvertStringToBool01("0", &b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(util::ConvertStringToBool01("2", &b));
}

TEST(String, ParseMajorMinor) {
  std::optional<uint64_t> major, minor;

  ASSERT_TRUE(util::ParseMajorMinor("8:16", false, &major, &minor));
  EXPECT_EQ(major, 8U);
  EXPECT_EQ(minor, 16U);

  ASSERT_TRUE(util::ParseMajorMinor("*:*", true, &major, &minor));
  EXPECT_FALSE(major.has_value());
  EXPECT_FALSE(minor.has_value());

  EXPECT_FALSE(util::ParseMajorMinor("*:1", false, &major, &minor));
  EXPECT_FALSE(util::ParseMajorMinor("8", true, &major, &minor));
  EXPECT_FALSE(util::ParseMajorMinor("8:1:2", true, &major, &minor));
}

TEST(String, SplitLinesAndFields) {
  auto lines = util::SplitNonEmptyLines("a 1\n\n  b\t2  \n");
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(lines[0], "a 1");
  EXPECT_EQ(lines[1], "b\t2");

  auto fields = util::SplitFields("8:0  Read\t100");
  ASSERT_EQ(fields.size(), 3U);
  EXPECT_EQ(fields[1], "Read");
}

TEST(String, ReadableMemory) {
  EXPECT_EQ(util::ReadableMemory(512), "512B");
  EXPECT_EQ(util::ReadableMemory(2048), "2K");
  EXPECT_EQ(util::ReadableMemory(3ULL << 20), "3M");
  EXPECT_EQ(util::ReadableMemory(5ULL << 30), "5G");
}
