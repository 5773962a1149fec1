// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <hevcbox/media/formats/mp4/box_definitions.h>

#include <algorithm>
#include <limits>
#include <utility>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/strings/string_view.h>

#include <hevcbox/media/base/rcheck.h>
#include <hevcbox/media/formats/mp4/box_buffer.h>

namespace hevcbox {
namespace media {
namespace mp4 {

namespace {

// Default values for HEVCSampleEntry box.
const uint32_t kVideoResolution = 0x00480000;  // 72 dpi.
const uint16_t kVideoFrameCount = 1;
const uint16_t kVideoDepth = 0x0018;
const uint32_t kCompressorNameSize = 32u;

// Fixed fields of the decoder configuration record. Reserved bits are all
// ones; the fields that are not modeled are written with these values.
const uint8_t kConfigurationVersion = 1;
const uint16_t kMinSpatialSegmentation = 0xF000;  // Reserved bits, idc 0.
const uint8_t kParallelismType = 0xFC;            // Reserved bits, type 0.
const uint8_t kChromaFormatReserved = 0xFC;
const uint8_t kChromaFormatMask = 0x03;
const uint8_t kBitDepthReserved = 0xF8;
const uint8_t kBitDepthMask = 0x07;
const uint16_t kAverageFrameRate = 0;
const uint8_t kNumTemporalLayersMask = 0x07;
const uint8_t kTemporalIdNestedBit = 0x04;
const uint8_t kLengthSizeMinusOne = 0x03;  // 4-byte NAL unit lengths.

// version + general configuration + the fixed fields through numOfArrays.
const size_t kDecoderConfigurationFixedSize = 23;
// NAL unit type + numNalus.
const size_t kNalUnitArrayHeaderSize = 3;

const uint8_t kNalUnitArrayOrder[] = {
    HEVCDecoderConfiguration::kVps, HEVCDecoderConfiguration::kSps,
    HEVCDecoderConfiguration::kPps, HEVCDecoderConfiguration::kPrefixSei};

uint8_t PackBits(uint8_t reserved, uint8_t mask, uint8_t value) {
  return reserved | (value & mask);
}

uint8_t PackTemporalLayers(uint8_t num_temporal_layers,
                           bool temporal_id_nested) {
  return ((num_temporal_layers & kNumTemporalLayersMask) << 3) |
         (temporal_id_nested ? kTemporalIdNestedBit : 0) | kLengthSizeMinusOne;
}

void UnpackTemporalLayers(uint8_t packed,
                          uint8_t* num_temporal_layers,
                          bool* temporal_id_nested) {
  *num_temporal_layers = packed >> 3;
  *temporal_id_nested = (packed & kTemporalIdNestedBit) != 0;
}

const char* NalUnitTypeName(uint8_t type) {
  switch (type) {
    case HEVCDecoderConfiguration::kVps:
      return "video_parameter_sets";
    case HEVCDecoderConfiguration::kSps:
      return "sequence_parameter_sets";
    case HEVCDecoderConfiguration::kPps:
      return "picture_parameter_sets";
    case HEVCDecoderConfiguration::kPrefixSei:
      return "sei";
    default:
      return "unknown";
  }
}

std::string BytesToHex(const std::vector<uint8_t>& bytes) {
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

void AppendNalUnits(const char* name,
                    const std::vector<NalUnit>& nal_units,
                    std::string* str) {
  absl::StrAppendFormat(str, "%s: %d\n", name, nal_units.size());
  for (const NalUnit& nal_unit : nal_units)
    absl::StrAppendFormat(str, "  %s\n", BytesToHex(nal_unit.data));
}

}  // namespace

NalUnit::NalUnit() = default;
NalUnit::NalUnit(const std::vector<uint8_t>& data) : data(data) {}
NalUnit::~NalUnit() = default;

bool NalUnit::ReadWrite(BoxBuffer* buffer) {
  DCHECK_LE(data.size(), std::numeric_limits<uint16_t>::max());
  uint16_t length = static_cast<uint16_t>(data.size());
  RCHECK(buffer->ReadWriteUInt16(&length) &&
         buffer->ReadWriteVector(&data, length));
  return true;
}

uint32_t NalUnit::ComputeSize() const {
  return sizeof(uint16_t) + static_cast<uint32_t>(data.size());
}

HEVCDecoderConfiguration::HEVCDecoderConfiguration() = default;
HEVCDecoderConfiguration::~HEVCDecoderConfiguration() = default;

FourCC HEVCDecoderConfiguration::BoxType() const {
  return FOURCC_hvcC;
}

std::vector<NalUnit>* HEVCDecoderConfiguration::NalUnitsOfType(uint8_t type) {
  switch (type) {
    case kVps:
      return &video_parameter_sets;
    case kSps:
      return &sequence_parameter_sets;
    case kPps:
      return &picture_parameter_sets;
    case kPrefixSei:
      return &sei;
    default:
      return NULL;
  }
}

size_t HEVCDecoderConfiguration::NumNalUnits() const {
  return video_parameter_sets.size() + sequence_parameter_sets.size() +
         picture_parameter_sets.size() + sei.size();
}

bool HEVCDecoderConfiguration::ReadWriteInternal(BoxBuffer* buffer) {
  RCHECK(ReadWriteHeaderInternal(buffer));

  uint8_t version = kConfigurationVersion;
  std::vector<uint8_t> general(general_configuration.begin(),
                               general_configuration.end());
  uint16_t min_spatial_segmentation = kMinSpatialSegmentation;
  uint8_t parallelism_type = kParallelismType;
  uint8_t chroma_format =
      PackBits(kChromaFormatReserved, kChromaFormatMask, chroma_format_idc);
  uint8_t bit_depth_luma =
      PackBits(kBitDepthReserved, kBitDepthMask, bit_depth_luma_minus8);
  uint8_t bit_depth_chroma =
      PackBits(kBitDepthReserved, kBitDepthMask, bit_depth_chroma_minus8);
  uint16_t average_frame_rate = kAverageFrameRate;
  uint8_t temporal_layers =
      PackTemporalLayers(num_temporal_layers, temporal_id_nested);
  DCHECK_LE(NumNalUnits(), std::numeric_limits<uint8_t>::max());
  uint8_t num_nal_units = static_cast<uint8_t>(NumNalUnits());

  RCHECK(buffer->ReadWriteUInt8(&version) &&
         buffer->ReadWriteVector(&general, kGeneralConfigurationSize) &&
         buffer->ReadWriteUInt16(&min_spatial_segmentation) &&
         buffer->ReadWriteUInt8(&parallelism_type) &&
         buffer->ReadWriteUInt8(&chroma_format) &&
         buffer->ReadWriteUInt8(&bit_depth_luma) &&
         buffer->ReadWriteUInt8(&bit_depth_chroma) &&
         buffer->ReadWriteUInt16(&average_frame_rate) &&
         buffer->ReadWriteUInt8(&temporal_layers) &&
         buffer->ReadWriteUInt8(&num_nal_units));

  if (!buffer->Reading()) {
    for (uint8_t type : kNalUnitArrayOrder) {
      std::vector<NalUnit>* nal_units = NalUnitsOfType(type);
      if (nal_units->empty())
        continue;
      DCHECK_LE(nal_units->size(), std::numeric_limits<uint16_t>::max());
      uint16_t count = static_cast<uint16_t>(nal_units->size());
      RCHECK(buffer->ReadWriteUInt8(&type) &&
             buffer->ReadWriteUInt16(&count));
      for (NalUnit& nal_unit : *nal_units)
        RCHECK(nal_unit.ReadWrite(buffer));
    }
    return true;
  }

  if (version != kConfigurationVersion) {
    LOG(WARNING) << "Unexpected hvcC configurationVersion "
                 << static_cast<int>(version) << ".";
  }
  std::copy(general.begin(), general.end(), general_configuration.begin());
  chroma_format_idc = chroma_format & kChromaFormatMask;
  bit_depth_luma_minus8 = bit_depth_luma & kBitDepthMask;
  bit_depth_chroma_minus8 = bit_depth_chroma & kBitDepthMask;
  UnpackTemporalLayers(temporal_layers, &num_temporal_layers,
                       &temporal_id_nested);

  video_parameter_sets.clear();
  sequence_parameter_sets.clear();
  picture_parameter_sets.clear();
  sei.clear();

  // The arrays are consumed until the declared number of NAL units has been
  // read. Entries of types that are not carried are dropped, including
  // carried types with the array_completeness bit set.
  size_t nal_units_read = 0;
  while (nal_units_read < num_nal_units) {
    uint8_t type = 0;
    uint16_t count = 0;
    RCHECK(buffer->ReadWriteUInt8(&type) && buffer->ReadWriteUInt16(&count));

    std::vector<NalUnit>* nal_units = NalUnitsOfType(type);
    if (!nal_units) {
      VLOG(1) << "Skipping " << count << " NAL units of type "
              << static_cast<int>(type) << " in hvcC.";
    }
    for (uint16_t i = 0; i < count; ++i) {
      NalUnit nal_unit;
      RCHECK(nal_unit.ReadWrite(buffer));
      if (nal_units)
        nal_units->push_back(std::move(nal_unit));
    }
    nal_units_read += count;
  }
  return true;
}

size_t HEVCDecoderConfiguration::ComputeSizeInternal() {
  size_t size = HeaderSize() + kDecoderConfigurationFixedSize;
  for (uint8_t type : kNalUnitArrayOrder) {
    const std::vector<NalUnit>* nal_units = NalUnitsOfType(type);
    if (nal_units->empty())
      continue;
    size += kNalUnitArrayHeaderSize;
    for (const NalUnit& nal_unit : *nal_units)
      size += nal_unit.ComputeSize();
  }
  return size;
}

std::string HEVCDecoderConfiguration::ToString() const {
  std::string str = absl::StrFormat(
      "general_configuration: %s\n"
      "num_temporal_layers: %d\n"
      "chroma_format_idc: %d\n"
      "bit_depth_luma_minus8: %d\n"
      "bit_depth_chroma_minus8: %d\n"
      "temporal_id_nested: %s\n",
      absl::BytesToHexString(absl::string_view(
          reinterpret_cast<const char*>(general_configuration.data()),
          general_configuration.size())),
      num_temporal_layers, chroma_format_idc, bit_depth_luma_minus8,
      bit_depth_chroma_minus8, temporal_id_nested ? "true" : "false");
  AppendNalUnits(NalUnitTypeName(kVps), video_parameter_sets, &str);
  AppendNalUnits(NalUnitTypeName(kSps), sequence_parameter_sets, &str);
  AppendNalUnits(NalUnitTypeName(kPps), picture_parameter_sets, &str);
  AppendNalUnits(NalUnitTypeName(kPrefixSei), sei, &str);
  return str;
}

std::string HEVCDecoderConfiguration::Summary() const {
  return absl::StrFormat("chroma_format_idc=%d", chroma_format_idc);
}

HEVCSampleEntry::HEVCSampleEntry()
    : horizontal_resolution(FixedPoint16::FromRaw(kVideoResolution)),
      vertical_resolution(FixedPoint16::FromRaw(kVideoResolution)),
      frame_count(kVideoFrameCount),
      depth(kVideoDepth) {}
HEVCSampleEntry::~HEVCSampleEntry() = default;

FourCC HEVCSampleEntry::BoxType() const {
  return format;
}

// static
HEVCSampleEntry HEVCSampleEntry::FromConfig(
    const HEVCSampleEntryConfig& config) {
  HEVCSampleEntry entry;
  entry.format = config.use_hev1 ? FOURCC_hev1 : FOURCC_hvc1;
  entry.data_reference_index = 1;
  entry.width = config.width;
  entry.height = config.height;

  HEVCDecoderConfiguration& hvcc = entry.hvcc;
  if (!config.general_configuration.empty()) {
    if (config.general_configuration.size() !=
        HEVCDecoderConfiguration::kGeneralConfigurationSize) {
      LOG(WARNING) << "general_configuration is "
                   << config.general_configuration.size()
                   << " bytes; expecting "
                   << HEVCDecoderConfiguration::kGeneralConfigurationSize
                   << ".";
    }
    std::copy_n(config.general_configuration.begin(),
                std::min(config.general_configuration.size(),
                         hvcc.general_configuration.size()),
                hvcc.general_configuration.begin());
  }
  hvcc.chroma_format_idc = config.chroma_format_idc;
  hvcc.bit_depth_luma_minus8 = config.bit_depth_luma_minus8;
  hvcc.bit_depth_chroma_minus8 = config.bit_depth_chroma_minus8;
  hvcc.num_temporal_layers = config.num_temporal_layers;
  hvcc.temporal_id_nested = config.temporal_id_nested;

  for (const std::vector<uint8_t>& vps : config.vps)
    hvcc.video_parameter_sets.emplace_back(vps);
  for (const std::vector<uint8_t>& sps : config.sps)
    hvcc.sequence_parameter_sets.emplace_back(sps);
  for (const std::vector<uint8_t>& pps : config.pps)
    hvcc.picture_parameter_sets.emplace_back(pps);
  for (const std::vector<uint8_t>& sei : config.sei)
    hvcc.sei.emplace_back(sei);
  return entry;
}

bool HEVCSampleEntry::ReadWriteInternal(BoxBuffer* buffer) {
  if (buffer->Reading()) {
    DCHECK(buffer->reader());
    format = buffer->reader()->type();
  }
  if (format != FOURCC_hvc1 && format != FOURCC_hev1) {
    LOG(ERROR) << FourCCToString(format) << " is not an HEVC sample entry.";
    return false;
  }
  RCHECK(ReadWriteHeaderInternal(buffer));

  uint32_t horizontal = horizontal_resolution.raw_value();
  uint32_t vertical = vertical_resolution.raw_value();
  int16_t predefined = -1;
  RCHECK(buffer->IgnoreBytes(6) &&  // reserved.
         buffer->ReadWriteUInt16(&data_reference_index) &&
         buffer->IgnoreBytes(16) &&  // predefined 0.
         buffer->ReadWriteUInt16(&width) && buffer->ReadWriteUInt16(&height) &&
         buffer->ReadWriteUInt32(&horizontal) &&
         buffer->ReadWriteUInt32(&vertical) &&
         buffer->IgnoreBytes(4) &&  // reserved.
         buffer->ReadWriteUInt16(&frame_count) &&
         buffer->IgnoreBytes(kCompressorNameSize) &&
         buffer->ReadWriteUInt16(&depth) &&
         buffer->ReadWriteInt16(&predefined));
  if (buffer->Reading()) {
    horizontal_resolution = FixedPoint16::FromRaw(horizontal);
    vertical_resolution = FixedPoint16::FromRaw(vertical);
  }

  RCHECK(buffer->ReadWriteChild(&hvcc));
  return true;
}

size_t HEVCSampleEntry::ComputeSizeInternal() {
  return HeaderSize() + sizeof(data_reference_index) + sizeof(width) +
         sizeof(height) + sizeof(kVideoResolution) * 2 + sizeof(frame_count) +
         sizeof(depth) + kCompressorNameSize + hvcc.ComputeSize() + 6 + 4 +
         16 + 2;  // 6 + 4 bytes reserved, 16 + 2 bytes predefined.
}

std::string HEVCSampleEntry::ToString() const {
  std::string str = absl::StrFormat(
      "format: %s\n"
      "data_reference_index: %d\n"
      "width: %d\n"
      "height: %d\n"
      "horizontal_resolution: %.4f\n"
      "vertical_resolution: %.4f\n"
      "frame_count: %d\n"
      "depth: %d\n"
      "%s:\n",
      FourCCToString(format), data_reference_index, width, height,
      horizontal_resolution.value(), vertical_resolution.value(), frame_count,
      depth, FourCCToString(hvcc.BoxType()));
  for (absl::string_view line :
       absl::StrSplit(hvcc.ToString(), '\n', absl::SkipEmpty())) {
    absl::StrAppend(&str, "  ", line, "\n");
  }
  return str;
}

std::string HEVCSampleEntry::Summary() const {
  return absl::StrFormat(
      "data_reference_index=%d width=%d height=%d frame_count=%d",
      data_reference_index, width, height, frame_count);
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
