// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_BOX_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_BOX_H_

#include <cstddef>
#include <cstdint>

#include <hevcbox/media/base/fourccs.h>

namespace hevcbox {
namespace media {

class BufferWriter;

namespace mp4 {

class BoxBuffer;
class BoxReader;

/// An ISO BMFF box (ISO 14496-12 4.2). Subclasses describe their payload
/// once, in ReadWriteInternal(), for both directions. Boxes are always
/// written with a compact 32-bit size.
struct Box {
 public:
  Box();
  virtual ~Box();

  /// Decode the payload from @a reader, whose header has already been read.
  bool Parse(BoxReader* reader);
  /// Append the whole box, header included, to @a writer.
  void Write(BufferWriter* writer);
  /// Recompute and cache the box size, header and children included.
  uint32_t ComputeSize();
  /// @return Size of the compact box header.
  uint32_t HeaderSize() const;
  virtual FourCC BoxType() const = 0;

  /// @return The size cached by the last ComputeSize() call.
  uint32_t box_size() const { return box_size_; }

 protected:
  /// Write size and type in write mode. In read mode BoxReader has consumed
  /// the header already and this is a no-op.
  bool ReadWriteHeaderInternal(BoxBuffer* buffer);

 private:
  friend class BoxBuffer;
  virtual bool ReadWriteInternal(BoxBuffer* buffer) = 0;
  // Size of the box without updating |box_size_|.
  virtual size_t ComputeSizeInternal() = 0;

  uint32_t box_size_;
};

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_BOX_H_
