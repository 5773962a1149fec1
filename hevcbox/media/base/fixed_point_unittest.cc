// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/base/fixed_point.h>

#include <gtest/gtest.h>

namespace hevcbox {
namespace media {

TEST(FixedPoint16Test, DefaultIsZero) {
  EXPECT_EQ(0u, FixedPoint16().raw_value());
}

TEST(FixedPoint16Test, SeventyTwoDpi) {
  FixedPoint16 dpi(72.0);
  EXPECT_EQ(0x00480000u, dpi.raw_value());
  EXPECT_DOUBLE_EQ(72.0, dpi.value());
}

TEST(FixedPoint16Test, FromRaw) {
  FixedPoint16 half = FixedPoint16::FromRaw(0x00008000);
  EXPECT_DOUBLE_EQ(0.5, half.value());
  EXPECT_EQ(FixedPoint16(0.5), half);
  EXPECT_NE(FixedPoint16(1.0), half);
}

TEST(FixedPoint16Test, MaxRawValue) {
  FixedPoint16 max = FixedPoint16::FromRaw(0xFFFFFFFF);
  EXPECT_DOUBLE_EQ(65535.0 + 65535.0 / 65536.0, max.value());
  EXPECT_EQ(0xFFFFFFFFu, max.raw_value());
}

}  // namespace media
}  // namespace hevcbox
