// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/file/local_file.h>

#include <filesystem>
#include <system_error>

#include <absl/log/check.h>
#include <absl/log/log.h>

namespace hevcbox {

LocalFile::LocalFile(const char* file_name, const char* mode)
    : File(file_name), mode_(mode), stream_(NULL) {
  if (mode_.find('b') == std::string::npos)
    mode_ += 'b';
}

LocalFile::~LocalFile() {}

bool LocalFile::Close() {
  const bool closed = !stream_ || fclose(stream_) == 0;
  stream_ = NULL;
  delete this;
  return closed;
}

int64_t LocalFile::Read(void* buffer, uint64_t length) {
  DCHECK(buffer);
  DCHECK(stream_);
  const size_t bytes_read = fread(buffer, 1, length, stream_);
  if (bytes_read < length && ferror(stream_)) {
    LOG(ERROR) << "Read error in " << file_name();
    clearerr(stream_);
    return bytes_read > 0 ? static_cast<int64_t>(bytes_read) : -1;
  }
  return static_cast<int64_t>(bytes_read);
}

int64_t LocalFile::Write(const void* buffer, uint64_t length) {
  DCHECK(buffer);
  DCHECK(stream_);
  const size_t bytes_written = fwrite(buffer, 1, length, stream_);
  if (bytes_written < length && ferror(stream_)) {
    LOG(ERROR) << "Write error in " << file_name();
    clearerr(stream_);
    return bytes_written > 0 ? static_cast<int64_t>(bytes_written) : -1;
  }
  return static_cast<int64_t>(bytes_written);
}

int64_t LocalFile::Size() {
  DCHECK(stream_);
  // Buffered writes are not visible to the file system yet.
  if (mode_.find_first_of("wa+") != std::string::npos && fflush(stream_) != 0)
    return -1;

  std::error_code ec;
  const uintmax_t size =
      std::filesystem::file_size(std::filesystem::u8path(file_name()), ec);
  if (ec) {
    LOG(ERROR) << "Cannot get the size of " << file_name() << ": "
               << ec.message();
    return -1;
  }
  return static_cast<int64_t>(size);
}

bool LocalFile::Seek(uint64_t position) {
  DCHECK(stream_);
  return fseeko(stream_, static_cast<off_t>(position), SEEK_SET) == 0;
}

bool LocalFile::Tell(uint64_t* position) {
  DCHECK(stream_);
  const off_t offset = ftello(stream_);
  if (offset < 0)
    return false;
  *position = static_cast<uint64_t>(offset);
  return true;
}

bool LocalFile::Open() {
  const std::filesystem::path path = std::filesystem::u8path(file_name());
  if (mode_.find('w') != std::string::npos && path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      LOG(ERROR) << "Cannot create " << path.parent_path().u8string() << ": "
                 << ec.message();
      return false;
    }
  }
  stream_ = fopen(path.u8string().c_str(), mode_.c_str());
  return stream_ != NULL;
}

// static
bool LocalFile::Delete(const char* file_name) {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::u8path(file_name), ec);
  return !ec;
}

}  // namespace hevcbox
