// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/media/formats/mp4/sample_entry_codec.h>

#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <hevcbox/file.h>
#include <hevcbox/macros/status.h>
#include <hevcbox/media/base/buffer_writer.h>
#include <hevcbox/media/formats/mp4/box_definitions.h>
#include <hevcbox/media/formats/mp4/box_reader.h>

namespace hevcbox {
namespace media {
namespace mp4 {

namespace {

const size_t kBoxHeaderSize = 8;
// Box header with a 64-bit largesize.
const size_t kLargeBoxHeaderSize = 16;

bool IsHEVCSampleEntry(FourCC type) {
  return type == FOURCC_hvc1 || type == FOURCC_hev1;
}

Status HeaderError(bool err, const char* what) {
  if (err)
    return Status(error::PARSER_FAILURE,
                  absl::StrFormat("Invalid %s box header.", what));
  return Status(
      error::END_OF_STREAM,
      absl::StrFormat("Not enough data for the %s box header.", what));
}

Status ValidateForWrite(const HEVCSampleEntry& entry) {
  if (!IsHEVCSampleEntry(entry.format)) {
    return Status(error::INVALID_ARGUMENT,
                  "Unsupported sample entry format " +
                      FourCCToString(entry.format) + ".");
  }
  const HEVCDecoderConfiguration& hvcc = entry.hvcc;
  if (hvcc.NumNalUnits() > std::numeric_limits<uint8_t>::max()) {
    return Status(error::INVALID_ARGUMENT,
                  absl::StrFormat("hvcC carries %d NAL units; at most %d fit.",
                                  hvcc.NumNalUnits(),
                                  std::numeric_limits<uint8_t>::max()));
  }
  for (const std::vector<NalUnit>* nal_units :
       {&hvcc.video_parameter_sets, &hvcc.sequence_parameter_sets,
        &hvcc.picture_parameter_sets, &hvcc.sei}) {
    for (const NalUnit& nal_unit : *nal_units) {
      if (nal_unit.data.size() > std::numeric_limits<uint16_t>::max()) {
        return Status(error::INVALID_ARGUMENT,
                      absl::StrFormat("NAL unit of %d bytes exceeds %d bytes.",
                                      nal_unit.data.size(),
                                      std::numeric_limits<uint16_t>::max()));
      }
    }
  }
  return Status::OK;
}

// Reads exactly |length| bytes.
Status ReadFully(File* file, uint8_t* buffer, uint64_t length) {
  while (length > 0) {
    const int64_t bytes_read = file->Read(buffer, length);
    if (bytes_read < 0)
      return Status(error::FILE_FAILURE,
                    "Cannot read from file " + file->file_name());
    if (bytes_read == 0)
      return Status(error::END_OF_STREAM,
                    "Unexpected end of file " + file->file_name());
    buffer += bytes_read;
    length -= bytes_read;
  }
  return Status::OK;
}

}  // namespace

Status ParseSampleEntry(const uint8_t* data,
                        size_t size,
                        HEVCSampleEntry* entry,
                        size_t* bytes_consumed) {
  DCHECK(entry);
  if (!data || size == 0)
    return HeaderError(false, "sample entry");

  FourCC type = FOURCC_NULL;
  uint64_t box_size = 0;
  bool err = false;
  if (!BoxReader::StartBox(data, size, &type, &box_size, &err))
    return HeaderError(err, "sample entry");
  if (!IsHEVCSampleEntry(type)) {
    return Status(error::PARSER_FAILURE,
                  "Expecting hvc1 or hev1, found " + FourCCToString(type) +
                      ".");
  }
  if (box_size > size) {
    return Status(
        error::END_OF_STREAM,
        absl::StrFormat("%s box declares %d bytes, only %d available.",
                        FourCCToString(type), box_size, size));
  }

  std::unique_ptr<BoxReader> reader(BoxReader::ReadBox(data, size, &err));
  if (!reader)
    return HeaderError(err, FourCCToString(type).c_str());

  // The configuration record must directly follow the fixed fields.
  const size_t nested_offset =
      reader->pos() + HEVCSampleEntry::kFixedFieldsSize;
  if (nested_offset >= box_size) {
    return Status(error::END_OF_STREAM,
                  FourCCToString(type) + " box ends before its hvcC box.");
  }
  FourCC nested_type = FOURCC_NULL;
  uint64_t nested_size = 0;
  if (!BoxReader::StartBox(data + nested_offset, box_size - nested_offset,
                           &nested_type, &nested_size, &err)) {
    return HeaderError(err, "hvcC");
  }
  if (nested_type != FOURCC_hvcC) {
    return Status(error::PARSER_FAILURE,
                  "Expecting hvcC in " + FourCCToString(type) + ", found " +
                      FourCCToString(nested_type) + ".");
  }

  HEVCSampleEntry parsed;
  if (!parsed.Parse(reader.get())) {
    return Status(error::END_OF_STREAM,
                  FourCCToString(type) + " box ends before its declared data.");
  }
  *entry = std::move(parsed);
  if (bytes_consumed)
    *bytes_consumed = static_cast<size_t>(box_size);
  return Status::OK;
}

Status ReadSampleEntry(File* file, HEVCSampleEntry* entry) {
  DCHECK(file);
  DCHECK(entry);

  uint64_t start = 0;
  if (!file->Tell(&start))
    return Status(error::FILE_FAILURE,
                  "Cannot get the position of " + file->file_name());

  std::vector<uint8_t> buffer(kBoxHeaderSize);
  RETURN_IF_ERROR(ReadFully(file, buffer.data(), buffer.size()));
  // size == 1 means a 64-bit largesize follows the type.
  if (buffer[0] == 0 && buffer[1] == 0 && buffer[2] == 0 && buffer[3] == 1) {
    buffer.resize(kLargeBoxHeaderSize);
    RETURN_IF_ERROR(ReadFully(file, &buffer[kBoxHeaderSize],
                              kLargeBoxHeaderSize - kBoxHeaderSize));
  }

  FourCC type = FOURCC_NULL;
  uint64_t box_size = 0;
  bool err = false;
  if (!BoxReader::StartBox(buffer.data(), buffer.size(), &type, &box_size,
                           &err)) {
    return HeaderError(err, "sample entry");
  }
  if (!IsHEVCSampleEntry(type)) {
    return Status(error::PARSER_FAILURE,
                  "Expecting hvc1 or hev1, found " + FourCCToString(type) +
                      ".");
  }

  const int64_t file_size = file->Size();
  if (file_size >= 0 && start + box_size > static_cast<uint64_t>(file_size)) {
    return Status(error::END_OF_STREAM,
                  absl::StrFormat("%s box at %d declares %d bytes, beyond the "
                                  "end of %s.",
                                  FourCCToString(type), start, box_size,
                                  file->file_name()));
  }

  const size_t header_size = buffer.size();
  buffer.resize(box_size);
  RETURN_IF_ERROR(
      ReadFully(file, &buffer[header_size], box_size - header_size));
  RETURN_IF_ERROR(ParseSampleEntry(buffer.data(), buffer.size(), entry, NULL));

  if (!file->Seek(start + box_size))
    return Status(error::FILE_FAILURE,
                  "Cannot seek in " + file->file_name());
  return Status::OK;
}

Status WriteSampleEntry(HEVCSampleEntry* entry, BufferWriter* writer) {
  DCHECK(entry);
  DCHECK(writer);

  Status status = ValidateForWrite(*entry);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot encode sample entry: " << status;
    return status;
  }
  entry->Write(writer);
  return Status::OK;
}

Status WriteSampleEntry(HEVCSampleEntry* entry,
                        File* file,
                        uint64_t* bytes_written) {
  DCHECK(file);

  BufferWriter writer;
  RETURN_IF_ERROR(WriteSampleEntry(entry, &writer));
  const uint64_t size = writer.Size();
  RETURN_IF_ERROR(writer.WriteToFile(file));
  if (bytes_written)
    *bytes_written = size;
  return Status::OK;
}

}  // namespace mp4
}  // namespace media
}  // namespace hevcbox
