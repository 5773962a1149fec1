// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/formats/mp4/box.h>

#include <absl/log/check.h>

#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/formats/mp4/box_buffer.h>

namespace hevcbox {
namespace media {
namespace mp4 {

namespace {
const uint32_t kCompactHeaderSize = sizeof(uint32_t) + sizeof(FourCC);
}  // namespace

Box::Box() : box_size_(0) {}
Box::~Box() {}

bool Box::Parse(BoxReader* reader) {
  DCHECK(reader);
  BoxBuffer buffer(reader);
  return ReadWriteInternal(&buffer);
}

void Box::Write(BufferWriter* writer) {
  DCHECK(writer);
  ComputeSize();
  const size_t start = writer->Size();
  BoxBuffer buffer(writer);
  CHECK(ReadWriteInternal(&buffer)) << FourCCToString(BoxType());
  DCHECK_EQ(box_size_, writer->Size() - start) << FourCCToString(BoxType());
}

uint32_t Box::ComputeSize() {
  box_size_ = static_cast<uint32_t>(ComputeSizeInternal());
  return box_size_;
}

uint32_t Box::HeaderSize() const {
  return kCompactHeaderSize;
}

bool Box::ReadWriteHeaderInternal(BoxBuffer* buffer) {
  if (buffer->Reading())
    return true;
  FourCC type = BoxType();
  return buffer->ReadWriteUInt32(&box_size_) && buffer->ReadWriteFourCC(&type);
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
