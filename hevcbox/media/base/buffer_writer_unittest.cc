// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/base/buffer_writer.h>

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hevcbox/file.h>
#include <hevcbox/file/file_closer.h>
#include <hevcbox/file/file_test_util.h>
#include <hevcbox/file/memory_file.h>
#include <hevcbox/status/status_test_util.h>

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

namespace hevcbox {
namespace media {

namespace {
const uint8_t kPps[] = {0x44, 0x01, 0xC1, 0x72, 0xB4, 0x62, 0x40};
}  // namespace

class BufferWriterTest : public testing::Test {
 protected:
  void TearDown() override { MemoryFile::DeleteAll(); }

  std::vector<uint8_t> Contents() const {
    return std::vector<uint8_t>(writer_.Buffer(),
                                writer_.Buffer() + writer_.Size());
  }

  BufferWriter writer_;
};

TEST_F(BufferWriterTest, StartsEmpty) {
  EXPECT_EQ(0u, writer_.Size());
}

TEST_F(BufferWriterTest, IntegersAreBigEndian) {
  writer_.AppendInt(static_cast<uint8_t>(0x01));
  writer_.AppendInt(static_cast<uint16_t>(0xF000));
  writer_.AppendInt(static_cast<int16_t>(-1));
  writer_.AppendInt(static_cast<uint32_t>(0x00480000));
  EXPECT_THAT(Contents(), ElementsAre(0x01, 0xF0, 0x00, 0xFF, 0xFF, 0x00,
                                      0x48, 0x00, 0x00));
}

TEST_F(BufferWriterTest, LargeSize) {
  writer_.AppendInt(static_cast<uint64_t>(0x0000000100000010ULL));
  EXPECT_THAT(Contents(),
              ElementsAre(0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x10));
}

TEST_F(BufferWriterTest, AppendBytes) {
  writer_.AppendVector(std::vector<uint8_t>());
  EXPECT_EQ(0u, writer_.Size());

  writer_.AppendArray(kPps, 2);
  writer_.AppendVector(std::vector<uint8_t>(kPps + 2, kPps + sizeof(kPps)));
  EXPECT_THAT(Contents(), ElementsAreArray(kPps));
}

TEST_F(BufferWriterTest, Clear) {
  writer_.AppendArray(kPps, sizeof(kPps));
  writer_.Clear();
  EXPECT_EQ(0u, writer_.Size());
}

TEST_F(BufferWriterTest, WriteToFile) {
  TempFile temp_file;
  std::unique_ptr<File, FileCloser> file(
      File::Open(temp_file.path().c_str(), "w"));
  ASSERT_TRUE(file);
  writer_.AppendArray(kPps, sizeof(kPps));
  ASSERT_OK(writer_.WriteToFile(file.get()));
  EXPECT_EQ(0u, writer_.Size());
  ASSERT_TRUE(file.release()->Close());

  ASSERT_FILE_BYTES_EQ(temp_file.path().c_str(),
                       std::vector<uint8_t>(kPps, kPps + sizeof(kPps)));
}

TEST_F(BufferWriterTest, WriteAppendsAtFilePosition) {
  const char kFileName[] = "memory://appended";
  std::unique_ptr<File, FileCloser> file(File::Open(kFileName, "w"));
  ASSERT_TRUE(file);
  writer_.AppendArray(kPps, 3);
  ASSERT_OK(writer_.WriteToFile(file.get()));
  writer_.AppendArray(kPps + 3, sizeof(kPps) - 3);
  ASSERT_OK(writer_.WriteToFile(file.get()));
  file.reset();

  ASSERT_FILE_BYTES_EQ(kFileName,
                       std::vector<uint8_t>(kPps, kPps + sizeof(kPps)));
}

TEST_F(BufferWriterTest, WriteToReadOnlyFileFails) {
  const char kFileName[] = "memory://read_only";
  ASSERT_TRUE(File::WriteStringToFile(kFileName, "abc"));

  std::unique_ptr<File, FileCloser> file(File::Open(kFileName, "r"));
  ASSERT_TRUE(file);
  writer_.AppendArray(kPps, sizeof(kPps));
  EXPECT_ERROR_CODE(error::FILE_FAILURE, writer_.WriteToFile(file.get()));
  EXPECT_EQ(sizeof(kPps), writer_.Size());
}

}  // namespace media
}  // namespace hevcbox
