// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_

#include <array>
#include <string>
#include <vector>

#include <hevcbox/hevc_sample_entry_config.h>
#include <hevcbox/media/base/fixed_point.h>
#include <hevcbox/media/base/fourccs.h>
#include <hevcbox/media/formats/mp4/box.h>

namespace hevcbox {
namespace media {
namespace mp4 {

class BoxBuffer;

#define DECLARE_BOX_METHODS(T)                        \
 public:                                              \
  T();                                                \
  ~T() override;                                      \
                                                      \
  FourCC BoxType() const override;                    \
                                                      \
 private:                                             \
  bool ReadWriteInternal(BoxBuffer* buffer) override; \
  size_t ComputeSizeInternal() override;              \
                                                      \
 public:

/// A NAL unit with a 16-bit length prefix, as stored in the parameter set
/// arrays of a decoder configuration record.
struct NalUnit {
  NalUnit();
  explicit NalUnit(const std::vector<uint8_t>& data);
  ~NalUnit();

  /// Read/Write NalUnit.
  /// @param buffer points to the box buffer for reading or writing.
  /// @return true on success, false otherwise.
  bool ReadWrite(BoxBuffer* buffer);
  /// @return The size of the structure in bytes when it is stored.
  uint32_t ComputeSize() const;

  std::vector<uint8_t> data;
};

/// HEVC decoder configuration record ('hvcC'), ISO/IEC 14496-15 8.3.3.1.
/// Parameter sets are kept as opaque NAL units, grouped by NAL unit type.
struct HEVCDecoderConfiguration : Box {
  DECLARE_BOX_METHODS(HEVCDecoderConfiguration);

  /// NAL unit types of the parameter set arrays, written in this order.
  enum NalUnitType : uint8_t {
    kVps = 32,
    kSps = 33,
    kPps = 34,
    kPrefixSei = 39,
  };

  static constexpr size_t kGeneralConfigurationSize = 12;

  /// @return The NAL units of @a type, or NULL if @a type is not carried.
  std::vector<NalUnit>* NalUnitsOfType(uint8_t type);
  /// @return Number of NAL units across all arrays.
  size_t NumNalUnits() const;

  /// @return A multi-line dump of all fields, one "key: value" per line.
  std::string ToString() const;
  std::string Summary() const;

  /// general_profile_space through general_level_idc, kept verbatim.
  std::array<uint8_t, kGeneralConfigurationSize> general_configuration = {};
  uint8_t num_temporal_layers = 0;
  uint8_t chroma_format_idc = 0;
  uint8_t bit_depth_luma_minus8 = 0;
  uint8_t bit_depth_chroma_minus8 = 0;
  bool temporal_id_nested = false;

  std::vector<NalUnit> video_parameter_sets;
  std::vector<NalUnit> sequence_parameter_sets;
  std::vector<NalUnit> picture_parameter_sets;
  std::vector<NalUnit> sei;
};

/// HEVC visual sample entry ('hvc1' or 'hev1'), ISO/IEC 14496-15 8.4.1.
struct HEVCSampleEntry : Box {
  DECLARE_BOX_METHODS(HEVCSampleEntry);

  /// Bytes between the box header and the nested 'hvcC' box.
  static constexpr size_t kFixedFieldsSize = 8 + 70;

  /// Build a sample entry with data_reference_index 1, wrapping each
  /// parameter set in @a config in the order given.
  static HEVCSampleEntry FromConfig(const HEVCSampleEntryConfig& config);

  /// @return A multi-line dump of all fields with the configuration record
  ///         indented below it.
  std::string ToString() const;
  std::string Summary() const;

  FourCC format = FOURCC_hvc1;
  uint16_t data_reference_index = 0;
  uint16_t width = 0;
  uint16_t height = 0;
  FixedPoint16 horizontal_resolution;
  FixedPoint16 vertical_resolution;
  uint16_t frame_count;
  uint16_t depth;

  HEVCDecoderConfiguration hvcc;
};

#undef DECLARE_BOX_METHODS

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_
