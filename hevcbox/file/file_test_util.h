// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_FILE_FILE_TEST_UTIL_H_
#define HEVCBOX_FILE_FILE_TEST_UTIL_H_

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <hevcbox/file.h>

namespace hevcbox {

#define ASSERT_FILE_BYTES_EQ(file_name, bytes)                     \
  do {                                                            \
    std::string temp_data;                                        \
    ASSERT_TRUE(File::ReadFileToString((file_name), &temp_data)); \
    ASSERT_EQ(std::string((bytes).begin(), (bytes).end()),        \
              temp_data);                                         \
  } while (false)

/// @return A unique path in the system temp directory. The file exists and
///         is empty.
std::string generate_unique_temp_path();

/// A temp file path that is removed on destruction.
class TempFile {
 public:
  TempFile();
  ~TempFile();

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace hevcbox

#endif  // HEVCBOX_FILE_FILE_TEST_UTIL_H_
