// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/utils/string_trim_split.h>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

namespace hevcbox {

std::vector<std::string> SplitAndTrimSkipEmpty(absl::string_view str,
                                               char delimiter) {
  std::vector<std::string> results;
  for (absl::string_view token :
       absl::StrSplit(str, delimiter, absl::SkipEmpty())) {
    token = absl::StripAsciiWhitespace(token);
    if (!token.empty())
      results.emplace_back(token);
  }
  return results;
}

}  // namespace hevcbox
