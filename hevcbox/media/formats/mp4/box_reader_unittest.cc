// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <hevcbox/media/formats/mp4/box_reader.h>

#include <cstdint>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/base/rcheck.h>
#include <hevcbox/media/formats/mp4/box_buffer.h>

namespace hevcbox {
namespace media {
namespace mp4 {

namespace {

const uint8_t kParentBox[] = {
    // 'skip' parent, 44 bytes, with a 16-bit tag.
    0x00, 0x00, 0x00, 0x2C, 's', 'k', 'i', 'p', 0x12, 0x34,
    // 'free' child with a compact header and two bytes it does not describe.
    0x00, 0x00, 0x00, 0x0E, 'f', 'r', 'e', 'e', 0x01, 0x02, 0x03, 0x04,
    0xEE, 0xEE,
    // 'free' child with a 64-bit size.
    0x00, 0x00, 0x00, 0x01, 'f', 'r', 'e', 'e', 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x14, 0x0A, 0x0B, 0x0C, 0x0D,
    // Not part of the parent.
    0xAB, 0xAB};

const size_t kParentBoxSize = 0x2C;
const size_t kFirstChildSizeOffset = 13;
const size_t kSecondChildTypeOffset = 28;

struct FreeBox : Box {
  FourCC BoxType() const override { return FOURCC_free; }
  bool ReadWriteInternal(BoxBuffer* buffer) override {
    return ReadWriteHeaderInternal(buffer) && buffer->ReadWriteUInt32(&value);
  }
  size_t ComputeSizeInternal() override {
    return HeaderSize() + sizeof(value);
  }

  uint32_t value = 0;
};

struct ParentBox : Box {
  FourCC BoxType() const override { return FOURCC_skip; }
  bool ReadWriteInternal(BoxBuffer* buffer) override {
    RCHECK(ReadWriteHeaderInternal(buffer) && buffer->ReadWriteUInt16(&tag));
    return buffer->ReadWriteChild(&first) && buffer->ReadWriteChild(&second);
  }
  size_t ComputeSizeInternal() override {
    return HeaderSize() + sizeof(tag) + first.ComputeSize() +
           second.ComputeSize();
  }

  uint16_t tag = 0;
  FreeBox first;
  FreeBox second;
};

}  // namespace

class BoxReaderTest : public testing::Test {
 protected:
  void SetUp() override {
    data_.assign(kParentBox, kParentBox + sizeof(kParentBox));
  }

  // Parses |data_| as a ParentBox.
  bool ParseParent(ParentBox* box) {
    bool err = false;
    std::unique_ptr<BoxReader> reader(
        BoxReader::ReadBox(data_.data(), data_.size(), &err));
    if (!reader)
      return false;
    return box->Parse(reader.get());
  }

  std::vector<uint8_t> data_;
};

TEST_F(BoxReaderTest, ReadsChildrenInOrder) {
  bool err = true;
  std::unique_ptr<BoxReader> reader(
      BoxReader::ReadBox(data_.data(), data_.size(), &err));
  ASSERT_TRUE(reader);
  EXPECT_FALSE(err);
  EXPECT_EQ(FOURCC_skip, reader->type());
  EXPECT_EQ(kParentBoxSize, reader->size());

  ParentBox box;
  ASSERT_TRUE(box.Parse(reader.get()));
  EXPECT_EQ(0x1234, box.tag);
  EXPECT_EQ(0x01020304u, box.first.value);
  EXPECT_EQ(0x0A0B0C0Du, box.second.value);
  EXPECT_EQ(kParentBoxSize, reader->pos());
}

TEST_F(BoxReaderTest, TruncatedBoxIsNotAnError) {
  bool err = true;
  std::unique_ptr<BoxReader> reader(
      BoxReader::ReadBox(data_.data(), kParentBoxSize - 1, &err));
  EXPECT_FALSE(reader);
  EXPECT_FALSE(err);
}

TEST_F(BoxReaderTest, ChildLargerThanParent) {
  data_[kFirstChildSizeOffset] = 0x40;
  ParentBox box;
  EXPECT_FALSE(ParseParent(&box));
}

TEST_F(BoxReaderTest, ChildTypeMismatch) {
  data_[kSecondChildTypeOffset] = 'm';
  data_[kSecondChildTypeOffset + 1] = 'd';
  data_[kSecondChildTypeOffset + 2] = 'a';
  data_[kSecondChildTypeOffset + 3] = 't';
  ParentBox box;
  EXPECT_FALSE(ParseParent(&box));
  EXPECT_EQ(0x01020304u, box.first.value);
}

TEST_F(BoxReaderTest, StartBoxNeedsOnlyTheHeader) {
  FourCC type = FOURCC_NULL;
  uint64_t box_size = 0;
  bool err = true;
  ASSERT_TRUE(BoxReader::StartBox(&data_[24], 16, &type, &box_size, &err));
  EXPECT_FALSE(err);
  EXPECT_EQ(FOURCC_free, type);
  EXPECT_EQ(0x14u, box_size);

  // A 64-bit size that is cut short.
  EXPECT_FALSE(BoxReader::StartBox(&data_[24], 12, &type, &box_size, &err));
  EXPECT_FALSE(err);
  EXPECT_FALSE(BoxReader::StartBox(data_.data(), 7, &type, &box_size, &err));
  EXPECT_FALSE(err);
}

TEST_F(BoxReaderTest, ZeroSizeRejected) {
  const uint8_t kData[] = {0x00, 0x00, 0x00, 0x00, 'f', 'r', 'e', 'e'};
  bool err = false;
  std::unique_ptr<BoxReader> reader(
      BoxReader::ReadBox(kData, sizeof(kData), &err));
  EXPECT_FALSE(reader);
  EXPECT_TRUE(err);
}

TEST_F(BoxReaderTest, SizeBelowHeaderRejected) {
  const uint8_t kCompact[] = {0x00, 0x00, 0x00, 0x07, 'f', 'r', 'e', 'e'};
  bool err = false;
  EXPECT_FALSE(BoxReader::ReadBox(kCompact, sizeof(kCompact), &err));
  EXPECT_TRUE(err);

  // 64-bit size smaller than the 16-byte header.
  const uint8_t kLarge[] = {0x00, 0x00, 0x00, 0x01, 'f',  'r',  'e',  'e',
                            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x0C};
  err = false;
  EXPECT_FALSE(BoxReader::ReadBox(kLarge, sizeof(kLarge), &err));
  EXPECT_TRUE(err);
}

TEST_F(BoxReaderTest, OversizedBoxRejected) {
  const uint8_t kData[] = {0x00, 0x00, 0x00, 0x01, 'f',  'r',  'e',  'e',
                           0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
  FourCC type = FOURCC_NULL;
  uint64_t box_size = 0;
  bool err = false;
  EXPECT_FALSE(BoxReader::StartBox(kData, sizeof(kData), &type, &box_size,
                                   &err));
  EXPECT_TRUE(err);
}

TEST_F(BoxReaderTest, WriteMatchesComputedSize) {
  ParentBox box;
  box.tag = 0x1234;
  box.first.value = 0x01020304;
  box.second.value = 0x0A0B0C0D;

  BufferWriter writer;
  box.Write(&writer);
  // Children are written with compact headers.
  ASSERT_EQ(8u + 2u + 12u + 12u, writer.Size());
  EXPECT_EQ(box.box_size(), writer.Size());

  bool err = false;
  std::unique_ptr<BoxReader> reader(
      BoxReader::ReadBox(writer.Buffer(), writer.Size(), &err));
  ASSERT_TRUE(reader);
  ParentBox parsed;
  ASSERT_TRUE(parsed.Parse(reader.get()));
  EXPECT_EQ(0x1234, parsed.tag);
  EXPECT_EQ(0x0A0B0C0Du, parsed.second.value);
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
