// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/utils/absl_flag_hexbytes.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hevcbox/utils/hex_parser.h>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace hevcbox {

TEST(HexParserTest, Valid) {
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(ValidHexStringToBytes("00fFa0", &bytes));
  EXPECT_THAT(bytes, ElementsAre(0x00, 0xFF, 0xA0));
}

TEST(HexParserTest, Invalid) {
  std::vector<uint8_t> bytes;
  EXPECT_FALSE(ValidHexStringToBytes("0g", &bytes));
  EXPECT_FALSE(ValidHexStringToBytes("abc", &bytes));
}

TEST(HexBytesFlagTest, ParseAndUnparse) {
  HexBytes flag;
  std::string error;
  ASSERT_TRUE(AbslParseFlag(" 0160000000 ", &flag, &error));
  EXPECT_THAT(flag.bytes, ElementsAre(0x01, 0x60, 0x00, 0x00, 0x00));
  EXPECT_EQ("0160000000", AbslUnparseFlag(flag));

  ASSERT_TRUE(AbslParseFlag("", &flag, &error));
  EXPECT_THAT(flag.bytes, IsEmpty());

  EXPECT_FALSE(AbslParseFlag("xyz", &flag, &error));
  EXPECT_EQ("Invalid hex string", error);
}

TEST(HexBytesListFlagTest, ParseAndUnparse) {
  HexBytesList flag;
  std::string error;
  ASSERT_TRUE(AbslParseFlag("4201, 4401c1,,", &flag, &error));
  ASSERT_EQ(2u, flag.entries.size());
  EXPECT_THAT(flag.entries[0], ElementsAre(0x42, 0x01));
  EXPECT_THAT(flag.entries[1], ElementsAre(0x44, 0x01, 0xC1));
  EXPECT_EQ("4201,4401c1", AbslUnparseFlag(flag));
}

TEST(HexBytesListFlagTest, InvalidEntryLeavesFlagUnchanged) {
  HexBytesList flag;
  flag.entries.push_back({0x01});
  std::string error;
  EXPECT_FALSE(AbslParseFlag("4201,zz", &flag, &error));
  EXPECT_EQ("Invalid hex string 'zz'", error);
  ASSERT_EQ(1u, flag.entries.size());
}

}  // namespace hevcbox
