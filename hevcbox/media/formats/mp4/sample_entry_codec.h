// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_SAMPLE_ENTRY_CODEC_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_SAMPLE_ENTRY_CODEC_H_

#include <cstdint>

#include <hevcbox/status.h>

namespace hevcbox {

class File;

namespace media {

class BufferWriter;

namespace mp4 {

struct HEVCSampleEntry;

/// Decode one 'hvc1' or 'hev1' box at the start of @a data.
/// @param[out] entry is only modified on success.
/// @param[out] bytes_consumed is set to the declared box size on success. It
///             can be NULL.
/// @return PARSER_FAILURE if the data is malformed, e.g. the box is not an
///         HEVC sample entry or the nested box is not 'hvcC'; END_OF_STREAM
///         if the data ends before the declared contents.
Status ParseSampleEntry(const uint8_t* data,
                        size_t size,
                        HEVCSampleEntry* entry,
                        size_t* bytes_consumed);

/// Decode one sample entry at the current position of @a file. On success the
/// file is positioned at the start position plus the declared box size.
/// @return FILE_FAILURE if the file cannot be read, told or seeked, otherwise
///         as ParseSampleEntry.
Status ReadSampleEntry(File* file, HEVCSampleEntry* entry);

/// Encode @a entry. The declared size is recomputed from the current fields.
/// @return INVALID_ARGUMENT if a NAL unit count or length does not fit its
///         field, in which case nothing is written.
Status WriteSampleEntry(HEVCSampleEntry* entry, BufferWriter* writer);

/// Encode @a entry at the current position of @a file.
/// @param[out] bytes_written is set to the box size on success. It can be
///             NULL.
Status WriteSampleEntry(HEVCSampleEntry* entry,
                        File* file,
                        uint64_t* bytes_written);

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_SAMPLE_ENTRY_CODEC_H_
