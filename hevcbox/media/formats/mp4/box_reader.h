// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_BOX_READER_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_BOX_READER_H_

#include <cstdint>

#include <hevcbox/macros/classes.h>
#include <hevcbox/media/base/buffer_reader.h>
#include <hevcbox/media/base/fourccs.h>

namespace hevcbox {
namespace media {
namespace mp4 {

struct Box;

/// Reads one box. Once the header is read the reader is limited to the
/// declared size of the box, so a box can never read into its successor.
///
/// Header failures come in two kinds, told apart by @a err: a header that is
/// cut short (@a err false, more data may fix it) and a header that can never
/// be valid (@a err true).
class BoxReader : public BufferReader {
 public:
  ~BoxReader();

  /// Start reading the box at the beginning of @a buf, which must outlive the
  /// reader.
  /// @return The reader positioned after the header, or NULL if the header is
  ///         bad or the box does not fit in @a buf_size bytes.
  static BoxReader* ReadBox(const uint8_t* buf,
                            const size_t buf_size,
                            bool* err);

  /// Peek at the header of the box at the beginning of @a buf without
  /// requiring the rest of the box to be present.
  [[nodiscard]] static bool StartBox(const uint8_t* buf,
                                     const size_t buf_size,
                                     FourCC* type,
                                     uint64_t* box_size,
                                     bool* err);

  /// Parse the box at the current position into @a child. The box must be of
  /// type child->BoxType() and lie within this box. Afterwards the position
  /// is at the end of the child as declared by its header.
  [[nodiscard]] bool ReadNextChild(Box* child);

  bool ReadFourCC(FourCC* fourcc) {
    uint32_t val = 0;
    if (!Read4(&val))
      return false;
    *fourcc = static_cast<FourCC>(val);
    return true;
  }

  FourCC type() const { return type_; }

 private:
  BoxReader(const uint8_t* buf, size_t size);

  // Reads size and type, then limits the reader to the box.
  bool ReadHeader(bool* err);

  FourCC type_;

  DISALLOW_COPY_AND_ASSIGN(BoxReader);
};

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_BOX_READER_H_
