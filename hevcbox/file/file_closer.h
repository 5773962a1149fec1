// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_FILE_FILE_CLOSER_H_
#define HEVCBOX_FILE_FILE_CLOSER_H_

#include <string>

#include <absl/log/log.h>

#include <hevcbox/file.h>

namespace hevcbox {

/// std::unique_ptr deleter for File. A File owns itself and is destroyed by
/// Close(), so it must never be deleted directly.
struct FileCloser {
  void operator()(File* file) const {
    if (!file)
      return;
    // Close() destroys |file|; keep the name for the log line.
    const std::string name = file->file_name();
    if (!file->Close())
      LOG(WARNING) << "Error closing " << name << ".";
  }
};

}  // namespace hevcbox

#endif  // HEVCBOX_FILE_FILE_CLOSER_H_
