// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_UTILS_STRING_TRIM_SPLIT_H_
#define HEVCBOX_UTILS_STRING_TRIM_SPLIT_H_

#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace hevcbox {

std::vector<std::string> SplitAndTrimSkipEmpty(absl::string_view str,
                                               char delimiter);

}  // namespace hevcbox

#endif  // HEVCBOX_UTILS_STRING_TRIM_SPLIT_H_
