// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <hevcbox/media/formats/mp4/box_reader.h>

#include <limits>
#include <memory>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <hevcbox/macros/logging.h>
#include <hevcbox/media/base/rcheck.h>
#include <hevcbox/media/formats/mp4/box.h>

namespace hevcbox {
namespace media {
namespace mp4 {

namespace {
// size == 1 in the compact header means a 64-bit size follows the type.
const uint32_t kLargeSizeMarker = 1;
// Sample entries and their configuration records are small.
const uint64_t kMaxBoxSize = std::numeric_limits<int32_t>::max();
}  // namespace

BoxReader::BoxReader(const uint8_t* buf, size_t size)
    : BufferReader(buf, size), type_(FOURCC_NULL) {
  DCHECK(buf);
  DCHECK_LT(0u, size);
}

BoxReader::~BoxReader() {
  if (pos() < size()) {
    DVLOG(1) << "Skipping " << size() - pos() << " trailing bytes in '"
             << FourCCToString(type_) << "'.";
  }
}

// static
BoxReader* BoxReader::ReadBox(const uint8_t* buf,
                              const size_t buf_size,
                              bool* err) {
  std::unique_ptr<BoxReader> reader(new BoxReader(buf, buf_size));
  if (!reader->ReadHeader(err) || reader->size() > buf_size)
    return NULL;
  return reader.release();
}

// static
bool BoxReader::StartBox(const uint8_t* buf,
                         const size_t buf_size,
                         FourCC* type,
                         uint64_t* box_size,
                         bool* err) {
  BoxReader reader(buf, buf_size);
  if (!reader.ReadHeader(err))
    return false;
  *type = reader.type();
  *box_size = reader.size();
  return true;
}

bool BoxReader::ReadNextChild(Box* child) {
  DCHECK(child);
  RCHECK(pos() < size());

  const size_t available = size() - pos();
  BoxReader child_reader(data() + pos(), available);
  bool err = false;
  RCHECK(child_reader.ReadHeader(&err));

  if (child_reader.type() != child->BoxType()) {
    LOG(ERROR) << "Expecting '" << FourCCToString(child->BoxType())
               << "' in '" << FourCCToString(type_) << "', found '"
               << FourCCToString(child_reader.type()) << "'.";
    return false;
  }
  RCHECK(child_reader.size() <= available);
  RCHECK(child->Parse(&child_reader));
  RCHECK(SkipBytes(child_reader.size()));
  return true;
}

bool BoxReader::ReadHeader(bool* err) {
  *err = false;
  uint32_t compact_size = 0;
  if (!Read4(&compact_size) || !ReadFourCC(&type_))
    return false;

  uint64_t box_size = compact_size;
  if (compact_size == 0) {
    NOTIMPLEMENTED() << "Box '" << FourCCToString(type_)
                     << "' extends to the end of the file.";
    *err = true;
    return false;
  }
  if (compact_size == kLargeSizeMarker && !Read8(&box_size))
    return false;

  if (box_size < pos()) {
    LOG(ERROR) << "Box '" << FourCCToString(type_) << "' declares " << box_size
               << " bytes, less than its own header.";
    *err = true;
    return false;
  }
  if (box_size > kMaxBoxSize) {
    LOG(ERROR) << "Box '" << FourCCToString(type_) << "' declares " << box_size
               << " bytes, more than supported.";
    *err = true;
    return false;
  }

  set_size(static_cast<size_t>(box_size));
  return true;
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
