// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/file.h>

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <hevcbox/file/file_closer.h>
#include <hevcbox/file/file_test_util.h>

namespace hevcbox {

namespace {
const int kDataSize = 1024;
}  // namespace

class LocalFileTest : public testing::Test {
 protected:
  void SetUp() override {
    data_.resize(kDataSize);
    for (int i = 0; i < kDataSize; ++i)
      data_[i] = static_cast<char>(i % 256);

    // Local file name with prefix for File API.
    local_file_name_ = kLocalFilePrefix;
    local_file_name_ += temp_file_.path();
  }

  std::string data_;
  TempFile temp_file_;
  std::string local_file_name_;
};

TEST_F(LocalFileTest, ReadNotExist) {
  ASSERT_TRUE(File::Delete(local_file_name_.c_str()));
  ASSERT_TRUE(File::Open(local_file_name_.c_str(), "r") == NULL);
}

TEST_F(LocalFileTest, WriteAndRead) {
  ASSERT_TRUE(File::WriteStringToFile(local_file_name_.c_str(), data_));

  std::string read_data;
  ASSERT_TRUE(File::ReadFileToString(local_file_name_.c_str(), &read_data));
  EXPECT_EQ(data_, read_data);
}

TEST_F(LocalFileTest, NoPrefixIsLocal) {
  ASSERT_TRUE(File::WriteStringToFile(temp_file_.path().c_str(), data_));

  std::string read_data;
  ASSERT_TRUE(File::ReadFileToString(local_file_name_.c_str(), &read_data));
  EXPECT_EQ(data_, read_data);
}

TEST_F(LocalFileTest, SeekTellAndSize) {
  ASSERT_TRUE(File::WriteStringToFile(local_file_name_.c_str(), data_));

  std::unique_ptr<File, FileCloser> file(
      File::Open(local_file_name_.c_str(), "r"));
  ASSERT_TRUE(file);
  EXPECT_EQ(kDataSize, file->Size());

  const uint64_t kSeekPosition = 100;
  ASSERT_TRUE(file->Seek(kSeekPosition));
  uint64_t position = 0;
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(kSeekPosition, position);

  char byte = 0;
  ASSERT_EQ(1, file->Read(&byte, 1));
  EXPECT_EQ(data_[kSeekPosition], byte);
}

}  // namespace hevcbox
