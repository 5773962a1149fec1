// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_BASE_BUFFER_WRITER_H_
#define HEVCBOX_MEDIA_BASE_BUFFER_WRITER_H_

#include <cstdint>
#include <vector>

#include <hevcbox/macros/classes.h>
#include <hevcbox/status.h>

namespace hevcbox {

class File;

namespace media {

/// Growable byte buffer that boxes are serialized into. Integers are
/// appended in network byte order.
class BufferWriter {
 public:
  BufferWriter();
  /// @param reserved_size_in_bytes is a capacity hint only.
  explicit BufferWriter(size_t reserved_size_in_bytes);
  ~BufferWriter();

  /// @{
  void AppendInt(uint8_t v);
  void AppendInt(uint16_t v);
  void AppendInt(int16_t v);
  void AppendInt(uint32_t v);
  void AppendInt(uint64_t v);
  /// @}

  void AppendVector(const std::vector<uint8_t>& v);
  void AppendArray(const uint8_t* buf, size_t size);

  void Clear() { buf_.clear(); }
  size_t Size() const { return buf_.size(); }
  const uint8_t* Buffer() const { return buf_.data(); }

  /// Write all buffered bytes to @a file at its current position. The buffer
  /// is emptied on success and kept on failure.
  /// @return OK, or FILE_FAILURE if @a file stops accepting bytes.
  Status WriteToFile(File* file);

 private:
  std::vector<uint8_t> buf_;

  DISALLOW_COPY_AND_ASSIGN(BufferWriter);
};

}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_BASE_BUFFER_WRITER_H_
