// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_
#define HEVCBOX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_

#include <vector>

#include <absl/log/check.h>

#include <hevcbox/macros/classes.h>
#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/formats/mp4/box.h>
#include <hevcbox/media/formats/mp4/box_reader.h>

namespace hevcbox {
namespace media {
namespace mp4 {

/// Either a BoxReader or a BufferWriter behind one set of ReadWrite calls,
/// so a box describes its layout once for both directions. In write mode
/// every call succeeds; in read mode a call fails when the box runs out of
/// data.
class BoxBuffer {
 public:
  explicit BoxBuffer(BoxReader* reader) : reader_(reader), writer_(NULL) {
    DCHECK(reader);
  }
  explicit BoxBuffer(BufferWriter* writer) : reader_(NULL), writer_(writer) {
    DCHECK(writer);
  }
  ~BoxBuffer() {}

  bool Reading() const { return reader_ != NULL; }

  bool ReadWriteUInt8(uint8_t* v) {
    if (Reading())
      return reader_->Read1(v);
    writer_->AppendInt(*v);
    return true;
  }
  bool ReadWriteUInt16(uint16_t* v) {
    if (Reading())
      return reader_->Read2(v);
    writer_->AppendInt(*v);
    return true;
  }
  bool ReadWriteInt16(int16_t* v) {
    if (Reading())
      return reader_->Read2s(v);
    writer_->AppendInt(*v);
    return true;
  }
  bool ReadWriteUInt32(uint32_t* v) {
    if (Reading())
      return reader_->Read4(v);
    writer_->AppendInt(*v);
    return true;
  }

  /// Read @a count bytes into @a vector, or write @a vector, which must hold
  /// exactly @a count bytes.
  bool ReadWriteVector(std::vector<uint8_t>* vector, size_t count) {
    if (Reading())
      return reader_->ReadToVector(vector, count);
    DCHECK_EQ(vector->size(), count);
    writer_->AppendVector(*vector);
    return true;
  }

  bool ReadWriteFourCC(FourCC* fourcc) {
    if (Reading())
      return reader_->ReadFourCC(fourcc);
    writer_->AppendInt(static_cast<uint32_t>(*fourcc));
    return true;
  }

  /// Read or write a nested box of type @a box->BoxType(). In read mode the
  /// nested box must be next and must fit in the current box.
  bool ReadWriteChild(Box* box) {
    if (Reading())
      return reader_->ReadNextChild(box);
    DCHECK_NE(0u, box->box_size()) << "ComputeSize() not called.";
    return box->ReadWriteInternal(this);
  }

  /// Skip @a num_bytes in read mode, or write that many zero bytes.
  bool IgnoreBytes(size_t num_bytes) {
    if (Reading())
      return reader_->SkipBytes(num_bytes);
    writer_->AppendVector(std::vector<uint8_t>(num_bytes, 0));
    return true;
  }

  /// @return The reader in read mode, NULL otherwise.
  BoxReader* reader() { return reader_; }

 private:
  BoxReader* reader_;
  BufferWriter* writer_;

  DISALLOW_COPY_AND_ASSIGN(BoxBuffer);
};

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_
