// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/formats/mp4/box_definitions.h>

#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/formats/mp4/box_definitions_comparison.h>
#include <hevcbox/media/formats/mp4/box_reader.h>

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace hevcbox {
namespace media {
namespace mp4 {
namespace {

const uint8_t kSps[] = {0x67, 0x64, 0x00, 0x0D, 0xAC, 0xD9, 0x41, 0x41,
                        0xFA, 0x10, 0x00, 0x00, 0x03, 0x00, 0x10, 0x00,
                        0x00, 0x03, 0x03, 0x20, 0xF1, 0x42, 0x99, 0x60};
const uint8_t kPps[] = {0x68, 0xEB, 0xE3, 0xCB, 0x22, 0xC0};
const uint8_t kVps[] = {0x40, 0x01, 0x0C, 0x01, 0xFF, 0xFF};
const uint8_t kSei[] = {0x4E, 0x01, 0x05};

// Main profile, main tier, level 4.1.
const uint8_t kGeneralConfiguration[] = {0x01, 0x60, 0x00, 0x00, 0x00, 0x90,
                                         0x00, 0x00, 0x00, 0x00, 0x00, 0x7B};

// The 'hvcC' box of the 1920x1080 example with one SPS and one PPS.
const uint8_t kExampleHvcC[] = {
    0x00, 0x00, 0x00, 0x47, 'h',  'v',  'c',  'C',
    0x01,                                            // configurationVersion.
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,              // general configuration.
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,              //
    0xF0, 0x00,                                      // minSpatialSegmentation.
    0xFC,                                            // parallelismType.
    0xFC,                                            // chromaFormat.
    0xF8,                                            // bitDepthLumaMinus8.
    0xF8,                                            // bitDepthChromaMinus8.
    0x00, 0x00,                                      // avgFrameRate.
    0x03,                                            // lengthSizeMinusOne.
    0x02,                                            // Total NAL units.
    0x21, 0x00, 0x01, 0x00, 0x18,                    // SPS array.
    0x67, 0x64, 0x00, 0x0D, 0xAC, 0xD9, 0x41, 0x41,
    0xFA, 0x10, 0x00, 0x00, 0x03, 0x00, 0x10, 0x00,
    0x00, 0x03, 0x03, 0x20, 0xF1, 0x42, 0x99, 0x60,
    0x22, 0x00, 0x01, 0x00, 0x06,                    // PPS array.
    0x68, 0xEB, 0xE3, 0xCB, 0x22, 0xC0,
};

std::vector<uint8_t> ToVector(const uint8_t* data, size_t size) {
  return std::vector<uint8_t>(data, data + size);
}

// Builds an 'hvcC' box with all fixed bytes set to |fixed_byte|, followed by
// |arrays| verbatim.
std::vector<uint8_t> BuildHvcC(uint8_t version,
                               uint8_t fixed_byte,
                               uint8_t num_nal_units,
                               const std::vector<uint8_t>& arrays) {
  BufferWriter writer;
  writer.AppendInt(static_cast<uint32_t>(8 + 23 + arrays.size()));
  writer.AppendInt(static_cast<uint32_t>(FOURCC_hvcC));
  writer.AppendInt(version);
  for (int i = 0; i < 21; ++i)
    writer.AppendInt(fixed_byte);
  writer.AppendInt(num_nal_units);
  writer.AppendVector(arrays);
  return ToVector(writer.Buffer(), writer.Size());
}

}  // namespace

class HEVCBoxDefinitionsTest : public testing::Test {
 public:
  HEVCBoxDefinitionsTest() {
    config_.width = 1920;
    config_.height = 1080;
    config_.sps.push_back(ToVector(kSps, sizeof(kSps)));
    config_.pps.push_back(ToVector(kPps, sizeof(kPps)));
  }

 protected:
  std::vector<uint8_t> Serialize(Box* box) {
    BufferWriter writer;
    box->Write(&writer);
    return ToVector(writer.Buffer(), writer.Size());
  }

  bool ReadBack(const std::vector<uint8_t>& data, Box* box) {
    bool err = false;
    std::unique_ptr<BoxReader> reader(
        BoxReader::ReadBox(data.data(), data.size(), &err));
    return reader && box->Parse(reader.get());
  }

  HEVCSampleEntryConfig config_;
};

TEST_F(HEVCBoxDefinitionsTest, WorkedExampleSizes) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  EXPECT_EQ(157u, entry.ComputeSize());
  EXPECT_EQ(71u, entry.hvcc.box_size());

  std::vector<uint8_t> data = Serialize(&entry);
  ASSERT_EQ(157u, data.size());
  EXPECT_THAT(std::vector<uint8_t>(data.begin(), data.begin() + 8),
              ElementsAre(0x00, 0x00, 0x00, 0x9D, 'h', 'v', 'c', '1'));
  EXPECT_EQ(ToVector(kExampleHvcC, sizeof(kExampleHvcC)),
            std::vector<uint8_t>(data.begin() + 86, data.end()));
}

TEST_F(HEVCBoxDefinitionsTest, SampleEntryFixedFields) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);
  ASSERT_EQ(157u, data.size());

  const uint8_t kExpectedFixedFields[] = {
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  // reserved.
      0x00, 0x01,                          // data_reference_index.
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  // pre_defined.
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
      0x07, 0x80,                          // width.
      0x04, 0x38,                          // height.
      0x00, 0x48, 0x00, 0x00,              // horizresolution.
      0x00, 0x48, 0x00, 0x00,              // vertresolution.
      0x00, 0x00, 0x00, 0x00,              // reserved.
      0x00, 0x01,                          // frame_count.
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  // compressorname.
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
      0x00, 0x18,                          // depth.
      0xFF, 0xFF,                          // pre_defined.
  };
  EXPECT_THAT(std::vector<uint8_t>(data.begin() + 8, data.begin() + 86),
              ElementsAreArray(kExpectedFixedFields));
}

TEST_F(HEVCBoxDefinitionsTest, DecoderConfigurationSize) {
  HEVCDecoderConfiguration hvcc;
  EXPECT_EQ(31u, hvcc.ComputeSize());

  hvcc.sequence_parameter_sets.emplace_back(ToVector(kSps, sizeof(kSps)));
  EXPECT_EQ(31u + 3 + 2 + sizeof(kSps), hvcc.ComputeSize());

  hvcc.sequence_parameter_sets.emplace_back(std::vector<uint8_t>());
  EXPECT_EQ(31u + 3 + 2 + sizeof(kSps) + 2, hvcc.ComputeSize());
  EXPECT_EQ(hvcc.ComputeSize(), Serialize(&hvcc).size());
}

TEST_F(HEVCBoxDefinitionsTest, RoundTrip) {
  config_.vps.push_back(ToVector(kVps, sizeof(kVps)));
  config_.sei.push_back(ToVector(kSei, sizeof(kSei)));
  config_.general_configuration =
      ToVector(kGeneralConfiguration, sizeof(kGeneralConfiguration));
  config_.chroma_format_idc = 1;
  config_.bit_depth_luma_minus8 = 2;
  config_.bit_depth_chroma_minus8 = 2;
  config_.num_temporal_layers = 1;
  config_.temporal_id_nested = true;
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  entry.horizontal_resolution = FixedPoint16(96.0);

  std::vector<uint8_t> data = Serialize(&entry);
  EXPECT_EQ(entry.box_size(), data.size());

  HEVCSampleEntry entry_readback;
  ASSERT_TRUE(ReadBack(data, &entry_readback));
  EXPECT_EQ(entry, entry_readback);
  EXPECT_EQ(FOURCC_hvc1, entry_readback.format);
  EXPECT_EQ(96.0, entry_readback.horizontal_resolution.value());
  EXPECT_EQ(72.0, entry_readback.vertical_resolution.value());
}

TEST_F(HEVCBoxDefinitionsTest, Hev1FormatPreserved) {
  config_.use_hev1 = true;
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);
  EXPECT_EQ('e', data[5]);

  HEVCSampleEntry entry_readback;
  ASSERT_TRUE(ReadBack(data, &entry_readback));
  EXPECT_EQ(FOURCC_hev1, entry_readback.format);
  EXPECT_EQ(entry, entry_readback);
}

TEST_F(HEVCBoxDefinitionsTest, OrderPreservedWithinType) {
  const std::vector<uint8_t> kFirst = {0x42, 0x01, 0x01};
  const std::vector<uint8_t> kSecond = {0x42, 0x01, 0x02, 0x03};
  const std::vector<uint8_t> kThird = {0x42};
  config_.sps = {kFirst, kSecond, kThird};
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);

  HEVCSampleEntry entry_readback;
  ASSERT_TRUE(ReadBack(Serialize(&entry), &entry_readback));
  ASSERT_EQ(3u, entry_readback.hvcc.sequence_parameter_sets.size());
  EXPECT_EQ(kFirst, entry_readback.hvcc.sequence_parameter_sets[0].data);
  EXPECT_EQ(kSecond, entry_readback.hvcc.sequence_parameter_sets[1].data);
  EXPECT_EQ(kThird, entry_readback.hvcc.sequence_parameter_sets[2].data);
}

TEST_F(HEVCBoxDefinitionsTest, EmptyTypesOmitted) {
  HEVCDecoderConfiguration hvcc;
  hvcc.picture_parameter_sets.emplace_back(ToVector(kPps, sizeof(kPps)));
  std::vector<uint8_t> data = Serialize(&hvcc);
  ASSERT_EQ(31u + 3 + 2 + sizeof(kPps), data.size());
  // Total count, then the PPS array directly.
  EXPECT_EQ(0x01, data[30]);
  EXPECT_EQ(0x22, data[31]);

  HEVCDecoderConfiguration hvcc_readback;
  ASSERT_TRUE(ReadBack(data, &hvcc_readback));
  EXPECT_THAT(hvcc_readback.video_parameter_sets, IsEmpty());
  EXPECT_THAT(hvcc_readback.sequence_parameter_sets, IsEmpty());
  EXPECT_THAT(hvcc_readback.sei, IsEmpty());
  EXPECT_EQ(hvcc, hvcc_readback);
}

TEST_F(HEVCBoxDefinitionsTest, ReservedBitsWritten) {
  HEVCDecoderConfiguration hvcc;
  hvcc.chroma_format_idc = 3;
  hvcc.bit_depth_luma_minus8 = 2;
  hvcc.bit_depth_chroma_minus8 = 7;
  hvcc.num_temporal_layers = 5;
  hvcc.temporal_id_nested = true;
  std::vector<uint8_t> data = Serialize(&hvcc);
  ASSERT_EQ(31u, data.size());
  EXPECT_THAT(std::vector<uint8_t>(data.begin() + 21, data.end()),
              ElementsAre(0xF0, 0x00, 0xFC, 0xFF, 0xFA, 0xFF, 0x00, 0x00,
                          0x2F, 0x00));
}

TEST_F(HEVCBoxDefinitionsTest, GeneralConfigurationVerbatim) {
  config_.general_configuration =
      ToVector(kGeneralConfiguration, sizeof(kGeneralConfiguration));
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);
  // hvcC starts at 86; general configuration follows its header and version.
  EXPECT_THAT(std::vector<uint8_t>(data.begin() + 95, data.begin() + 107),
              ElementsAreArray(kGeneralConfiguration));
}

TEST_F(HEVCBoxDefinitionsTest, MaskedFieldsTolerated) {
  HEVCDecoderConfiguration hvcc;
  ASSERT_TRUE(ReadBack(BuildHvcC(1, 0xFF, 0, {}), &hvcc));
  EXPECT_EQ(3, hvcc.chroma_format_idc);
  EXPECT_EQ(7, hvcc.bit_depth_luma_minus8);
  EXPECT_EQ(7, hvcc.bit_depth_chroma_minus8);
  EXPECT_EQ(31, hvcc.num_temporal_layers);
  EXPECT_TRUE(hvcc.temporal_id_nested);
}

TEST_F(HEVCBoxDefinitionsTest, TemporalLayersUseFiveBits) {
  HEVCDecoderConfiguration hvcc;
  ASSERT_TRUE(ReadBack(BuildHvcC(1, 0x43, 0, {}), &hvcc));
  EXPECT_EQ(8, hvcc.num_temporal_layers);
  EXPECT_FALSE(hvcc.temporal_id_nested);
}

TEST_F(HEVCBoxDefinitionsTest, UnknownTypeSkipped) {
  const std::vector<uint8_t> kArrays = {
      0x23, 0x00, 0x02,              // Access unit delimiters.
      0x00, 0x02, 0x46, 0x01,        //
      0x00, 0x01, 0x50,              //
      0x21, 0x00, 0x01,              // SPS.
      0x00, 0x03, 0x42, 0x01, 0x01,  //
  };
  HEVCDecoderConfiguration hvcc;
  ASSERT_TRUE(ReadBack(BuildHvcC(1, 0x00, 3, kArrays), &hvcc));
  EXPECT_THAT(hvcc.video_parameter_sets, IsEmpty());
  EXPECT_THAT(hvcc.picture_parameter_sets, IsEmpty());
  EXPECT_THAT(hvcc.sei, IsEmpty());
  ASSERT_EQ(1u, hvcc.sequence_parameter_sets.size());
  EXPECT_THAT(hvcc.sequence_parameter_sets[0].data,
              ElementsAre(0x42, 0x01, 0x01));
}

TEST_F(HEVCBoxDefinitionsTest, CompletenessBitMakesTypeUnknown) {
  const std::vector<uint8_t> kArrays = {
      0xA0, 0x00, 0x01,              // VPS with array_completeness set.
      0x00, 0x02, 0x40, 0x01,        //
      0xA1, 0x00, 0x01,              // SPS with array_completeness set.
      0x00, 0x01, 0x42,              //
      0x27, 0x00, 0x01,              // SEI.
      0x00, 0x01, 0x4E,              //
  };
  HEVCDecoderConfiguration hvcc;
  ASSERT_TRUE(ReadBack(BuildHvcC(1, 0x00, 3, kArrays), &hvcc));
  EXPECT_THAT(hvcc.video_parameter_sets, IsEmpty());
  EXPECT_THAT(hvcc.sequence_parameter_sets, IsEmpty());
  ASSERT_EQ(1u, hvcc.sei.size());
  EXPECT_THAT(hvcc.sei[0].data, ElementsAre(0x4E));
}

TEST_F(HEVCBoxDefinitionsTest, UnexpectedVersionStillDecoded) {
  const std::vector<uint8_t> kArrays = {0x22, 0x00, 0x01, 0x00, 0x01, 0x44};
  HEVCDecoderConfiguration hvcc;
  ASSERT_TRUE(ReadBack(BuildHvcC(2, 0x00, 1, kArrays), &hvcc));
  ASSERT_EQ(1u, hvcc.picture_parameter_sets.size());
}

TEST_F(HEVCBoxDefinitionsTest, TruncatedNalUnit) {
  // The NAL unit claims four bytes but only two remain in the box.
  const std::vector<uint8_t> kArrays = {0x21, 0x00, 0x01,
                                        0x00, 0x04, 0x42, 0x01};
  HEVCDecoderConfiguration hvcc;
  EXPECT_FALSE(ReadBack(BuildHvcC(1, 0x00, 1, kArrays), &hvcc));
}

TEST_F(HEVCBoxDefinitionsTest, MissingArrays) {
  // Declares one NAL unit but carries no arrays.
  HEVCDecoderConfiguration hvcc;
  EXPECT_FALSE(ReadBack(BuildHvcC(1, 0x00, 1, {}), &hvcc));
}

TEST_F(HEVCBoxDefinitionsTest, TrailingDataSkipped) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);

  // Grow the hvcC box by four bytes, then append a 'pasp'-like box after it.
  std::vector<uint8_t> padded(data.begin(), data.end());
  padded[89] += 4;
  padded.insert(padded.end(), {0xDE, 0xAD, 0xBE, 0xEF});
  padded.insert(padded.end(),
                {0x00, 0x00, 0x00, 0x10, 'p', 'a', 's', 'p', 0x00, 0x00,
                 0x00, 0x01, 0x00, 0x00, 0x00, 0x01});
  padded[3] = static_cast<uint8_t>(padded.size());

  HEVCSampleEntry entry_readback;
  ASSERT_TRUE(ReadBack(padded, &entry_readback));
  EXPECT_EQ(entry, entry_readback);
}

TEST_F(HEVCBoxDefinitionsTest, NestedTypeMismatch) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);
  // Rename 'hvcC' to 'avcC'.
  data[90] = 'a';

  HEVCSampleEntry entry_readback;
  EXPECT_FALSE(ReadBack(data, &entry_readback));
}

TEST_F(HEVCBoxDefinitionsTest, NotAnHevcSampleEntry) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::vector<uint8_t> data = Serialize(&entry);
  // Rename 'hvc1' to 'avc1'.
  data[4] = 'a';

  HEVCSampleEntry entry_readback;
  EXPECT_FALSE(ReadBack(data, &entry_readback));
}

TEST_F(HEVCBoxDefinitionsTest, Summary) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  EXPECT_EQ("data_reference_index=1 width=1920 height=1080 frame_count=1",
            entry.Summary());
  entry.hvcc.chroma_format_idc = 1;
  EXPECT_EQ("chroma_format_idc=1", entry.hvcc.Summary());
}

TEST_F(HEVCBoxDefinitionsTest, ToString) {
  HEVCSampleEntry entry = HEVCSampleEntry::FromConfig(config_);
  std::string dump = entry.ToString();
  EXPECT_THAT(dump, HasSubstr("format: hvc1\n"));
  EXPECT_THAT(dump, HasSubstr("width: 1920\n"));
  EXPECT_THAT(dump, HasSubstr("horizontal_resolution: 72.0000\n"));
  EXPECT_THAT(dump, HasSubstr("hvcC:\n  general_configuration: "
                              "000000000000000000000000\n"));
  EXPECT_THAT(dump, HasSubstr("  sequence_parameter_sets: 1\n"
                              "    6764000dacd94141fa1000000300100000030320"
                              "f1429960\n"));
  EXPECT_THAT(dump, HasSubstr("  picture_parameter_sets: 1\n"
                              "    68ebe3cb22c0\n"));
  EXPECT_THAT(dump, HasSubstr("  video_parameter_sets: 0\n"));
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
