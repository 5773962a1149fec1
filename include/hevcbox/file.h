// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_PUBLIC_FILE_H_
#define HEVCBOX_PUBLIC_FILE_H_

#include <cstdint>
#include <string>

#include <hevcbox/export.h>
#include <hevcbox/macros/classes.h>

namespace hevcbox {

extern const char* kLocalFilePrefix;
extern const char* kMemoryFilePrefix;

/// A seekable byte stream that sample entries are read from and written to.
/// Names starting with "memory://" live in process memory, everything else
/// (optionally prefixed with "file://") is a file on disk.
class HEVCBOX_EXPORT File {
 public:
  /// Open @a file_name. @a mode is "r" or "w"; local files also accept the
  /// other fopen modes.
  /// @return The opened file, to be released with Close(), or NULL.
  static File* Open(const char* file_name, const char* mode);

  /// Remove @a file_name.
  /// @return true if the file is gone.
  static bool Delete(const char* file_name);

  /// Release the file and delete this object.
  /// @return false if pending writes could not be committed.
  virtual bool Close() = 0;

  /// Read up to @a length bytes into @a buffer.
  /// @return Bytes read, 0 at end of file, or a negative value on error.
  virtual int64_t Read(void* buffer, uint64_t length) = 0;

  /// Write @a length bytes from @a buffer at the current position.
  /// @return Bytes written, or a negative value on error.
  virtual int64_t Write(const void* buffer, uint64_t length) = 0;

  /// @return Size in bytes, or a negative value on error.
  virtual int64_t Size() = 0;

  /// Move the read/write position to @a position.
  virtual bool Seek(uint64_t position) = 0;

  /// Store the read/write position in @a position.
  virtual bool Tell(uint64_t* position) = 0;

  /// @return The name without its prefix.
  const std::string& file_name() const { return file_name_; }

  /// Read all of @a file_name into @a contents.
  static bool ReadFileToString(const char* file_name, std::string* contents);

  /// Replace the contents of @a file_name with @a contents.
  static bool WriteStringToFile(const char* file_name,
                                const std::string& contents);

 protected:
  explicit File(const std::string& file_name) : file_name_(file_name) {}
  // Use Close() instead.
  virtual ~File() {}

  virtual bool Open() = 0;

 private:
  std::string file_name_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

}  // namespace hevcbox

#endif  // HEVCBOX_PUBLIC_FILE_H_
