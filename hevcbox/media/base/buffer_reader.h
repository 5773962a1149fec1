// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_BASE_BUFFER_READER_H_
#define HEVCBOX_MEDIA_BASE_BUFFER_READER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include <hevcbox/macros/classes.h>

namespace hevcbox {
namespace media {

/// Reads big-endian values from a byte span it does not own. A read that
/// would run past size() fails and leaves pos() where it was.
class BufferReader {
 public:
  BufferReader(const uint8_t* buf, size_t size)
      : buf_(buf), size_(size), pos_(0) {}
  ~BufferReader() {}

  bool HasBytes(size_t count) const { return count <= size_ - pos_; }

  /// @{
  [[nodiscard]] bool Read1(uint8_t* v);
  [[nodiscard]] bool Read2(uint16_t* v);
  [[nodiscard]] bool Read2s(int16_t* v);
  [[nodiscard]] bool Read4(uint32_t* v);
  [[nodiscard]] bool Read8(uint64_t* v);
  /// @}

  /// Copy the next @a count bytes into @a t, replacing its contents.
  [[nodiscard]] bool ReadToVector(std::vector<uint8_t>* t, size_t count);

  [[nodiscard]] bool SkipBytes(size_t num_bytes);

  const uint8_t* data() const { return buf_; }
  size_t size() const { return size_; }
  /// Narrow the readable span, e.g. to the declared size of a box. Must not
  /// be below pos().
  void set_size(size_t size);
  size_t pos() const { return pos_; }

 private:
  // Returns the start of the next |count| bytes and advances past them, or
  // NULL if they are not available.
  const uint8_t* Take(size_t count);

  const uint8_t* buf_;
  size_t size_;
  size_t pos_;

  DISALLOW_COPY_AND_ASSIGN(BufferReader);
};

}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_BASE_BUFFER_READER_H_
