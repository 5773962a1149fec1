// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Overloads operator== for mp4 boxes, mainly used for testing.

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_COMPARISON_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_COMPARISON_H_

#include <hevcbox/media/formats/mp4/box_definitions.h>

namespace hevcbox {
namespace media {
namespace mp4 {

inline bool operator==(const NalUnit& lhs, const NalUnit& rhs) {
  return lhs.data == rhs.data;
}

inline bool operator==(const HEVCDecoderConfiguration& lhs,
                       const HEVCDecoderConfiguration& rhs) {
  return lhs.general_configuration == rhs.general_configuration &&
         lhs.num_temporal_layers == rhs.num_temporal_layers &&
         lhs.chroma_format_idc == rhs.chroma_format_idc &&
         lhs.bit_depth_luma_minus8 == rhs.bit_depth_luma_minus8 &&
         lhs.bit_depth_chroma_minus8 == rhs.bit_depth_chroma_minus8 &&
         lhs.temporal_id_nested == rhs.temporal_id_nested &&
         lhs.video_parameter_sets == rhs.video_parameter_sets &&
         lhs.sequence_parameter_sets == rhs.sequence_parameter_sets &&
         lhs.picture_parameter_sets == rhs.picture_parameter_sets &&
         lhs.sei == rhs.sei;
}

inline bool operator==(const HEVCSampleEntry& lhs,
                       const HEVCSampleEntry& rhs) {
  return lhs.format == rhs.format &&
         lhs.data_reference_index == rhs.data_reference_index &&
         lhs.width == rhs.width && lhs.height == rhs.height &&
         lhs.horizontal_resolution == rhs.horizontal_resolution &&
         lhs.vertical_resolution == rhs.vertical_resolution &&
         lhs.frame_count == rhs.frame_count && lhs.depth == rhs.depth &&
         lhs.hvcc == rhs.hvcc;
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_COMPARISON_H_
