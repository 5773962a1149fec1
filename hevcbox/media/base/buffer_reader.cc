// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/base/buffer_reader.h>

#include <absl/base/internal/endian.h>
#include <absl/log/check.h>

namespace hevcbox {
namespace media {

const uint8_t* BufferReader::Take(size_t count) {
  if (!HasBytes(count))
    return NULL;
  const uint8_t* start = buf_ + pos_;
  pos_ += count;
  return start;
}

bool BufferReader::Read1(uint8_t* v) {
  DCHECK(v);
  const uint8_t* p = Take(sizeof(*v));
  if (!p)
    return false;
  *v = *p;
  return true;
}

bool BufferReader::Read2(uint16_t* v) {
  DCHECK(v);
  const uint8_t* p = Take(sizeof(*v));
  if (!p)
    return false;
  *v = absl::big_endian::Load16(p);
  return true;
}

bool BufferReader::Read2s(int16_t* v) {
  uint16_t raw = 0;
  if (!Read2(&raw))
    return false;
  *v = static_cast<int16_t>(raw);
  return true;
}

bool BufferReader::Read4(uint32_t* v) {
  DCHECK(v);
  const uint8_t* p = Take(sizeof(*v));
  if (!p)
    return false;
  *v = absl::big_endian::Load32(p);
  return true;
}

bool BufferReader::Read8(uint64_t* v) {
  DCHECK(v);
  const uint8_t* p = Take(sizeof(*v));
  if (!p)
    return false;
  *v = absl::big_endian::Load64(p);
  return true;
}

bool BufferReader::ReadToVector(std::vector<uint8_t>* t, size_t count) {
  DCHECK(t);
  const uint8_t* p = Take(count);
  if (!p)
    return false;
  t->assign(p, p + count);
  return true;
}

bool BufferReader::SkipBytes(size_t num_bytes) {
  return Take(num_bytes) != NULL;
}

void BufferReader::set_size(size_t size) {
  DCHECK_GE(size, pos_);
  size_ = size;
}

}  // namespace media
}  // namespace hevcbox
