// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/base/buffer_reader.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;

namespace hevcbox {
namespace media {

namespace {
const uint8_t kData[] = {0x01, 0x02, 0x03, 0x04, 0x05,
                         0x06, 0x07, 0x08, 0xFF, 0xFE};
}  // namespace

TEST(BufferReaderTest, BigEndianReads) {
  BufferReader reader(kData, sizeof(kData));
  uint8_t v8 = 0;
  uint16_t v16 = 0;
  uint32_t v32 = 0;
  int16_t v16s = 0;
  ASSERT_TRUE(reader.Read1(&v8));
  ASSERT_TRUE(reader.Read2(&v16));
  ASSERT_TRUE(reader.Read4(&v32));
  EXPECT_EQ(0x01u, v8);
  EXPECT_EQ(0x0203u, v16);
  EXPECT_EQ(0x04050607u, v32);
  ASSERT_TRUE(reader.SkipBytes(1));
  ASSERT_TRUE(reader.Read2s(&v16s));
  EXPECT_EQ(-2, v16s);
  EXPECT_FALSE(reader.HasBytes(1));
}

TEST(BufferReaderTest, Read8) {
  BufferReader reader(kData, sizeof(kData));
  uint64_t v = 0;
  ASSERT_TRUE(reader.Read8(&v));
  EXPECT_EQ(0x0102030405060708u, v);
}

TEST(BufferReaderTest, ReadToVectorReplacesContents) {
  BufferReader reader(kData, sizeof(kData));
  std::vector<uint8_t> vec = {0xAA, 0xBB, 0xCC, 0xDD};
  ASSERT_TRUE(reader.SkipBytes(8));
  ASSERT_TRUE(reader.ReadToVector(&vec, 2));
  EXPECT_THAT(vec, ElementsAre(0xFF, 0xFE));
  EXPECT_EQ(10u, reader.pos());
}

TEST(BufferReaderTest, ShortReadsFail) {
  BufferReader reader(kData, 3);
  uint32_t v32 = 0;
  EXPECT_FALSE(reader.Read4(&v32));
  EXPECT_EQ(0u, reader.pos());

  std::vector<uint8_t> vec;
  EXPECT_FALSE(reader.ReadToVector(&vec, 4));
  EXPECT_EQ(0u, reader.pos());
  EXPECT_FALSE(reader.SkipBytes(4));

  ASSERT_TRUE(reader.ReadToVector(&vec, 3));
  EXPECT_THAT(vec, ElementsAre(0x01, 0x02, 0x03));
}

TEST(BufferReaderTest, SetSizeLimitsReads) {
  BufferReader reader(kData, sizeof(kData));
  reader.set_size(2);
  uint16_t v16 = 0;
  ASSERT_TRUE(reader.Read2(&v16));
  uint8_t v8 = 0;
  EXPECT_FALSE(reader.Read1(&v8));
}

}  // namespace media
}  // namespace hevcbox
