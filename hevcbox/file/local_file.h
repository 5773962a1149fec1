// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_FILE_LOCAL_FILE_H_
#define HEVCBOX_FILE_LOCAL_FILE_H_

#include <cstdint>
#include <cstdio>
#include <string>

#include <hevcbox/file.h>
#include <hevcbox/macros/classes.h>

namespace hevcbox {

/// A File on disk, backed by stdio. Files are always opened in binary mode.
class LocalFile : public File {
 public:
  /// @param mode is an fopen mode.
  LocalFile(const char* file_name, const char* mode);

  bool Close() override;
  int64_t Read(void* buffer, uint64_t length) override;
  int64_t Write(const void* buffer, uint64_t length) override;
  int64_t Size() override;
  bool Seek(uint64_t position) override;
  bool Tell(uint64_t* position) override;

  static bool Delete(const char* file_name);

 protected:
  ~LocalFile() override;

  bool Open() override;

 private:
  std::string mode_;
  FILE* stream_;

  DISALLOW_COPY_AND_ASSIGN(LocalFile);
};

}  // namespace hevcbox

#endif  // HEVCBOX_FILE_LOCAL_FILE_H_
