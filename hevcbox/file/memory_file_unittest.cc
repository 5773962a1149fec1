// Copyright (c) 2015 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <hevcbox/file/memory_file.h>

#include <cstring>
#include <memory>

#include <gtest/gtest.h>

#include <hevcbox/file.h>
#include <hevcbox/file/file_closer.h>

namespace hevcbox {
namespace {

const uint8_t kWriteBuffer[] = {0, 0, 0, 8, 'f', 'r', 'e', 'e'};
const int64_t kWriteBufferSize = sizeof(kWriteBuffer);

}  // namespace

class MemoryFileTest : public testing::Test {
 protected:
  void TearDown() override { MemoryFile::DeleteAll(); }
};

TEST_F(MemoryFileTest, WriteThenReadBack) {
  std::unique_ptr<File, FileCloser> writer(File::Open("memory://file1", "w"));
  ASSERT_TRUE(writer);
  ASSERT_EQ(kWriteBufferSize, writer->Write(kWriteBuffer, kWriteBufferSize));
  ASSERT_TRUE(writer.release()->Close());

  std::unique_ptr<File, FileCloser> reader(File::Open("memory://file1", "r"));
  ASSERT_TRUE(reader);
  EXPECT_EQ(kWriteBufferSize, reader->Size());

  uint8_t read_buffer[kWriteBufferSize];
  ASSERT_EQ(kWriteBufferSize, reader->Read(read_buffer, kWriteBufferSize));
  EXPECT_EQ(0, memcmp(kWriteBuffer, read_buffer, kWriteBufferSize));
}

TEST_F(MemoryFileTest, ReadNotExist) {
  EXPECT_FALSE(File::Open("memory://missing", "r"));
}

TEST_F(MemoryFileTest, ReadOnlyRejectsWrite) {
  ASSERT_TRUE(File::WriteStringToFile("memory://file1", "abc"));
  std::unique_ptr<File, FileCloser> reader(File::Open("memory://file1", "r"));
  ASSERT_TRUE(reader);
  EXPECT_GT(0, reader->Write(kWriteBuffer, kWriteBufferSize));
}

TEST_F(MemoryFileTest, SeekAndTell) {
  std::unique_ptr<File, FileCloser> file(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file);
  ASSERT_EQ(kWriteBufferSize, file->Write(kWriteBuffer, kWriteBufferSize));

  const uint64_t seek_pos = kWriteBufferSize / 2;
  ASSERT_TRUE(file->Seek(seek_pos));
  uint64_t position = 0;
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(seek_pos, position);

  uint8_t read_buffer[kWriteBufferSize];
  EXPECT_EQ(kWriteBufferSize - static_cast<int64_t>(seek_pos),
            file->Read(read_buffer, kWriteBufferSize));
  EXPECT_EQ(0, file->Read(read_buffer, kWriteBufferSize));
}

TEST_F(MemoryFileTest, SeekPastEndFails) {
  std::unique_ptr<File, FileCloser> file(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file);
  ASSERT_EQ(kWriteBufferSize, file->Write(kWriteBuffer, kWriteBufferSize));
  EXPECT_FALSE(file->Seek(kWriteBufferSize + 1));
}

TEST_F(MemoryFileTest, OpenTwiceFails) {
  std::unique_ptr<File, FileCloser> first(File::Open("memory://file1", "w"));
  ASSERT_TRUE(first);
  EXPECT_FALSE(File::Open("memory://file1", "w"));
}

TEST_F(MemoryFileTest, Delete) {
  ASSERT_TRUE(File::WriteStringToFile("memory://file1", "abc"));
  EXPECT_TRUE(File::Delete("memory://file1"));
  EXPECT_FALSE(File::Open("memory://file1", "r"));
}

}  // namespace hevcbox
