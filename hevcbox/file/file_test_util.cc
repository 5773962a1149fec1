// Copyright 2022 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/file/file_test_util.h>

#include <unistd.h>

#include <cstdlib>
#include <filesystem>

namespace hevcbox {

std::string generate_unique_temp_path() {
  // The template must end in 6 X's. mkstemp replaces them, creates the file
  // and returns an open descriptor which is closed right away.
  auto temp_path_template =
      std::filesystem::temp_directory_path() / "hevcbox-test.XXXXXX";
  std::string temp_path_template_string = temp_path_template.string();
  int fd = mkstemp(temp_path_template_string.data());
  close(fd);
  return temp_path_template_string;
}

TempFile::TempFile() : path_(generate_unique_temp_path()) {}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::u8path(path_), ec);
  // Ignore errors.
}

}  // namespace hevcbox
