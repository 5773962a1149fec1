// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_FILE_MEMORY_FILE_H_
#define HEVCBOX_FILE_MEMORY_FILE_H_

#include <cstdint>
#include <string>
#include <vector>

#include <hevcbox/file.h>
#include <hevcbox/macros/classes.h>

namespace hevcbox {

/// A File kept in process memory under its name. Supports the "r" and "w"
/// modes; a name can be open at most once at a time.
class MemoryFile : public File {
 public:
  MemoryFile(const std::string& file_name, const std::string& mode);

  bool Close() override;
  int64_t Read(void* buffer, uint64_t length) override;
  int64_t Write(const void* buffer, uint64_t length) override;
  int64_t Size() override;
  /// Fails past the end of the data.
  bool Seek(uint64_t position) override;
  bool Tell(uint64_t* position) override;

  /// Drop the contents of every memory file. No file may be open.
  static void DeleteAll();
  /// Drop the contents of @a file_name.
  /// @return false if the file is open.
  static bool Delete(const std::string& file_name);

 protected:
  ~MemoryFile() override;
  bool Open() override;

 private:
  std::string mode_;
  std::vector<uint8_t>* data_;
  uint64_t position_;

  DISALLOW_COPY_AND_ASSIGN(MemoryFile);
};

}  // namespace hevcbox

#endif  // HEVCBOX_FILE_MEMORY_FILE_H_
