// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_PUBLIC_HEVC_SAMPLE_ENTRY_CONFIG_H_
#define HEVCBOX_PUBLIC_HEVC_SAMPLE_ENTRY_CONFIG_H_

#include <cstdint>
#include <vector>

namespace hevcbox {

/// Parameters to build an HEVC sample entry from scratch.
struct HEVCSampleEntryConfig {
  uint16_t width = 0;
  uint16_t height = 0;

  /// Raw parameter set NAL units, without start codes or length prefixes.
  /// Each is carried in the decoder configuration record in the order given.
  /// @{
  std::vector<std::vector<uint8_t>> vps;
  std::vector<std::vector<uint8_t>> sps;
  std::vector<std::vector<uint8_t>> pps;
  std::vector<std::vector<uint8_t>> sei;
  /// @}

  /// The 12-byte profile/tier/level block (general_profile_space through
  /// general_level_idc). Empty means all zero.
  std::vector<uint8_t> general_configuration;
  uint8_t chroma_format_idc = 0;
  uint8_t bit_depth_luma_minus8 = 0;
  uint8_t bit_depth_chroma_minus8 = 0;
  uint8_t num_temporal_layers = 0;
  bool temporal_id_nested = false;
  /// Use 'hev1' instead of 'hvc1' as the sample entry type.
  bool use_hev1 = false;
};

}  // namespace hevcbox

#endif  // HEVCBOX_PUBLIC_HEVC_SAMPLE_ENTRY_CONFIG_H_
