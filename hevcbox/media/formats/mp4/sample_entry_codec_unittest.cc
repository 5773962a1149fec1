// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/formats/mp4/sample_entry_codec.h>

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <hevcbox/file.h>
#include <hevcbox/file/file_closer.h>
#include <hevcbox/file/file_test_util.h>
#include <hevcbox/file/memory_file.h>
#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/formats/mp4/box_definitions.h>
#include <hevcbox/media/formats/mp4/box_definitions_comparison.h>
#include <hevcbox/status/status_test_util.h>

namespace hevcbox {
namespace media {
namespace mp4 {
namespace {

const char kInputFile[] = "memory://sample_entry.mp4";

const uint8_t kSps[] = {0x67, 0x64, 0x00, 0x0D, 0xAC, 0xD9, 0x41, 0x41,
                        0xFA, 0x10, 0x00, 0x00, 0x03, 0x00, 0x10, 0x00,
                        0x00, 0x03, 0x03, 0x20, 0xF1, 0x42, 0x99, 0x60};
const uint8_t kPps[] = {0x68, 0xEB, 0xE3, 0xCB, 0x22, 0xC0};

// Offset of the 'hvcC' type in a sample entry with a 32-bit header.
const size_t kHvcCTypeOffset = 8 + HEVCSampleEntry::kFixedFieldsSize + 4;

}  // namespace

class SampleEntryCodecTest : public testing::Test {
 public:
  void SetUp() override {
    HEVCSampleEntryConfig config;
    config.width = 1920;
    config.height = 1080;
    config.sps.emplace_back(kSps, kSps + sizeof(kSps));
    config.pps.emplace_back(kPps, kPps + sizeof(kPps));
    entry_ = HEVCSampleEntry::FromConfig(config);

    BufferWriter writer;
    ASSERT_OK(WriteSampleEntry(&entry_, &writer));
    data_.assign(writer.Buffer(), writer.Buffer() + writer.Size());
  }

  void TearDown() override { MemoryFile::DeleteAll(); }

 protected:
  void CreateInputFile(const std::vector<uint8_t>& data) {
    ASSERT_TRUE(File::WriteStringToFile(
        kInputFile, std::string(data.begin(), data.end())));
  }

  // An entry that is never equal to what the tests parse.
  HEVCSampleEntry Untouched() {
    HEVCSampleEntry entry;
    entry.width = 42;
    return entry;
  }

  HEVCSampleEntry entry_;
  std::vector<uint8_t> data_;
};

TEST_F(SampleEntryCodecTest, Parse) {
  HEVCSampleEntry entry;
  size_t bytes_consumed = 0;
  ASSERT_OK(ParseSampleEntry(data_.data(), data_.size(), &entry,
                             &bytes_consumed));
  EXPECT_EQ(157u, bytes_consumed);
  EXPECT_EQ(entry_, entry);
}

TEST_F(SampleEntryCodecTest, ParseIgnoresDataAfterTheBox) {
  data_.insert(data_.end(), {0x00, 0x00, 0x00, 0x08, 'f', 'r', 'e', 'e'});
  HEVCSampleEntry entry;
  size_t bytes_consumed = 0;
  ASSERT_OK(ParseSampleEntry(data_.data(), data_.size(), &entry,
                             &bytes_consumed));
  EXPECT_EQ(157u, bytes_consumed);
}

TEST_F(SampleEntryCodecTest, ParseLargeSizeHeader) {
  std::vector<uint8_t> data = {0x00, 0x00, 0x00, 0x01, 'h',  'v',
                               'c',  '1',  0x00, 0x00, 0x00, 0x00,
                               0x00, 0x00, 0x00, 157 + 8};
  data.insert(data.end(), data_.begin() + 8, data_.end());

  HEVCSampleEntry entry;
  size_t bytes_consumed = 0;
  ASSERT_OK(
      ParseSampleEntry(data.data(), data.size(), &entry, &bytes_consumed));
  EXPECT_EQ(165u, bytes_consumed);
  EXPECT_EQ(entry_, entry);
}

TEST_F(SampleEntryCodecTest, NestedTypeMismatch) {
  data_[kHvcCTypeOffset] = 'a';  // 'avcC'.
  HEVCSampleEntry entry = Untouched();
  Status status = ParseSampleEntry(data_.data(), data_.size(), &entry, NULL);
  EXPECT_ERROR_CODE(error::PARSER_FAILURE, status);
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, NotAnHevcSampleEntry) {
  data_[4] = 'a';  // 'avc1'.
  HEVCSampleEntry entry = Untouched();
  Status status = ParseSampleEntry(data_.data(), data_.size(), &entry, NULL);
  EXPECT_ERROR_CODE(error::PARSER_FAILURE, status);
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, ZeroBoxSize) {
  data_[3] = 0;
  HEVCSampleEntry entry;
  Status status = ParseSampleEntry(data_.data(), data_.size(), &entry, NULL);
  EXPECT_ERROR_CODE(error::PARSER_FAILURE, status);
}

TEST_F(SampleEntryCodecTest, TruncatedBox) {
  HEVCSampleEntry entry = Untouched();
  Status status =
      ParseSampleEntry(data_.data(), data_.size() - 1, &entry, NULL);
  EXPECT_ERROR_CODE(error::END_OF_STREAM, status);
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, TruncatedHeader) {
  HEVCSampleEntry entry;
  EXPECT_ERROR_CODE(error::END_OF_STREAM,
                    ParseSampleEntry(data_.data(), 4, &entry, NULL));
  EXPECT_ERROR_CODE(error::END_OF_STREAM,
                    ParseSampleEntry(data_.data(), 0, &entry, NULL));
}

TEST_F(SampleEntryCodecTest, DeclaredCountExceedsData) {
  // Total NAL unit count in hvcC, one more than carried.
  data_[8 + HEVCSampleEntry::kFixedFieldsSize + 8 + 22] = 3;
  HEVCSampleEntry entry = Untouched();
  Status status = ParseSampleEntry(data_.data(), data_.size(), &entry, NULL);
  EXPECT_ERROR_CODE(error::END_OF_STREAM, status);
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, WriteTooManyNalUnits) {
  entry_.hvcc.sei.resize(254, NalUnit(std::vector<uint8_t>(1, 0x4E)));
  BufferWriter writer;
  Status status = WriteSampleEntry(&entry_, &writer);
  EXPECT_ERROR_CODE(error::INVALID_ARGUMENT, status);
  EXPECT_EQ(0u, writer.Size());

  // 255 in total is still fine.
  entry_.hvcc.sei.pop_back();
  EXPECT_OK(WriteSampleEntry(&entry_, &writer));
  EXPECT_EQ(entry_.box_size(), writer.Size());
}

TEST_F(SampleEntryCodecTest, WriteNalUnitTooLong) {
  entry_.hvcc.picture_parameter_sets.emplace_back(
      std::vector<uint8_t>(0x10000, 0xAB));
  BufferWriter writer;
  Status status = WriteSampleEntry(&entry_, &writer);
  EXPECT_ERROR_CODE(error::INVALID_ARGUMENT, status);
  EXPECT_EQ(0u, writer.Size());
}

TEST_F(SampleEntryCodecTest, WriteUnsupportedFormat) {
  entry_.format = FOURCC_avc1;
  BufferWriter writer;
  EXPECT_ERROR_CODE(error::INVALID_ARGUMENT,
                    WriteSampleEntry(&entry_, &writer));
}

TEST_F(SampleEntryCodecTest, ReadFromFile) {
  // Two entries back to back.
  std::vector<uint8_t> data = data_;
  data.insert(data.end(), data_.begin(), data_.end());
  CreateInputFile(data);

  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  HEVCSampleEntry entry;
  uint64_t position = 0;
  ASSERT_OK(ReadSampleEntry(file.get(), &entry));
  EXPECT_EQ(entry_, entry);
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(157u, position);

  ASSERT_OK(ReadSampleEntry(file.get(), &entry));
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(314u, position);

  EXPECT_ERROR_CODE(error::END_OF_STREAM,
                    ReadSampleEntry(file.get(), &entry));
}

TEST_F(SampleEntryCodecTest, ReadSkipsToDeclaredEnd) {
  // Four bytes of trailing data inside the sample entry, then a 'free' box.
  std::vector<uint8_t> data = data_;
  data[3] += 4;
  data.insert(data.end(), {0x01, 0x02, 0x03, 0x04});
  data.insert(data.end(), {0x00, 0x00, 0x00, 0x08, 'f', 'r', 'e', 'e'});
  CreateInputFile(data);

  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  HEVCSampleEntry entry;
  ASSERT_OK(ReadSampleEntry(file.get(), &entry));
  EXPECT_EQ(entry_, entry);
  uint64_t position = 0;
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(161u, position);
}

TEST_F(SampleEntryCodecTest, ReadAtOffset) {
  std::vector<uint8_t> data = {0x00, 0x00, 0x00, 0x08, 's', 'k', 'i', 'p'};
  data.insert(data.end(), data_.begin(), data_.end());
  CreateInputFile(data);

  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  ASSERT_TRUE(file->Seek(8));
  HEVCSampleEntry entry;
  ASSERT_OK(ReadSampleEntry(file.get(), &entry));
  uint64_t position = 0;
  ASSERT_TRUE(file->Tell(&position));
  EXPECT_EQ(165u, position);
}

TEST_F(SampleEntryCodecTest, ReadTruncatedFile) {
  CreateInputFile(std::vector<uint8_t>(data_.begin(), data_.end() - 10));

  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  HEVCSampleEntry entry = Untouched();
  EXPECT_ERROR_CODE(error::END_OF_STREAM,
                    ReadSampleEntry(file.get(), &entry));
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, ReadNestedTypeMismatch) {
  data_[kHvcCTypeOffset] = 'a';
  CreateInputFile(data_);

  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  HEVCSampleEntry entry = Untouched();
  EXPECT_ERROR_CODE(error::PARSER_FAILURE,
                    ReadSampleEntry(file.get(), &entry));
  EXPECT_EQ(Untouched(), entry);
}

TEST_F(SampleEntryCodecTest, WriteThenReadLocalFile) {
  TempFile temp_file;

  std::unique_ptr<File, FileCloser> output(
      File::Open(temp_file.path().c_str(), "w"));
  ASSERT_TRUE(output);
  uint64_t bytes_written = 0;
  ASSERT_OK(WriteSampleEntry(&entry_, output.get(), &bytes_written));
  EXPECT_EQ(157u, bytes_written);
  output.reset();

  ASSERT_FILE_BYTES_EQ(temp_file.path().c_str(), data_);

  std::unique_ptr<File, FileCloser> input(
      File::Open(temp_file.path().c_str(), "r"));
  ASSERT_TRUE(input);
  HEVCSampleEntry entry;
  ASSERT_OK(ReadSampleEntry(input.get(), &entry));
  EXPECT_EQ(entry_, entry);
}

TEST_F(SampleEntryCodecTest, WriteToReadOnlyFile) {
  CreateInputFile(data_);
  std::unique_ptr<File, FileCloser> file(File::Open(kInputFile, "r"));
  ASSERT_TRUE(file);
  uint64_t bytes_written = 0;
  EXPECT_ERROR_CODE(error::FILE_FAILURE,
                    WriteSampleEntry(&entry_, file.get(), &bytes_written));
  EXPECT_EQ(0u, bytes_written);
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
