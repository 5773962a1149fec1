// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/base/buffer_writer.h>

#include <absl/base/internal/endian.h>
#include <absl/log/check.h>
#include <absl/strings/str_format.h>

#include <hevcbox/file.h>

namespace hevcbox {
namespace media {

namespace {
// Room for a sample entry with a handful of parameter sets.
const size_t kDefaultCapacity = 0x400;
}  // namespace

BufferWriter::BufferWriter() {
  buf_.reserve(kDefaultCapacity);
}

BufferWriter::BufferWriter(size_t reserved_size_in_bytes) {
  buf_.reserve(reserved_size_in_bytes);
}

BufferWriter::~BufferWriter() {}

void BufferWriter::AppendInt(uint8_t v) {
  buf_.push_back(v);
}

void BufferWriter::AppendInt(uint16_t v) {
  uint8_t bytes[sizeof(v)];
  absl::big_endian::Store16(bytes, v);
  AppendArray(bytes, sizeof(bytes));
}

void BufferWriter::AppendInt(int16_t v) {
  AppendInt(static_cast<uint16_t>(v));
}

void BufferWriter::AppendInt(uint32_t v) {
  uint8_t bytes[sizeof(v)];
  absl::big_endian::Store32(bytes, v);
  AppendArray(bytes, sizeof(bytes));
}

void BufferWriter::AppendInt(uint64_t v) {
  uint8_t bytes[sizeof(v)];
  absl::big_endian::Store64(bytes, v);
  AppendArray(bytes, sizeof(bytes));
}

void BufferWriter::AppendVector(const std::vector<uint8_t>& v) {
  buf_.insert(buf_.end(), v.begin(), v.end());
}

void BufferWriter::AppendArray(const uint8_t* buf, size_t size) {
  buf_.insert(buf_.end(), buf, buf + size);
}

Status BufferWriter::WriteToFile(File* file) {
  DCHECK(file);
  size_t offset = 0;
  while (offset < buf_.size()) {
    const int64_t bytes_written =
        file->Write(buf_.data() + offset, buf_.size() - offset);
    if (bytes_written <= 0) {
      return Status(error::FILE_FAILURE,
                    absl::StrFormat("Cannot write %d bytes to %s.",
                                    buf_.size() - offset, file->file_name()));
    }
    offset += static_cast<size_t>(bytes_written);
  }
  buf_.clear();
  return Status::OK;
}

}  // namespace media
}  // namespace hevcbox
