// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_UTILS_ABSL_FLAG_HEXBYTES_H_
#define HEVCBOX_UTILS_ABSL_FLAG_HEXBYTES_H_

#include <cstdint>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace hevcbox {

// Custom flag type for hexadecimal byte array, e.g. "0160000000".
struct HexBytes {
  std::vector<uint8_t> bytes;
};

// Custom flag type for a comma separated list of hexadecimal byte arrays,
// e.g. "4201,4401c1".
struct HexBytesList {
  std::vector<std::vector<uint8_t>> entries;
};

bool AbslParseFlag(absl::string_view text, HexBytes* flag, std::string* error);
std::string AbslUnparseFlag(const HexBytes& flag);

bool AbslParseFlag(absl::string_view text,
                   HexBytesList* flag,
                   std::string* error);
std::string AbslUnparseFlag(const HexBytesList& flag);

}  // namespace hevcbox

#endif  // HEVCBOX_UTILS_ABSL_FLAG_HEXBYTES_H_
