// Copyright 2022 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/utils/hex_parser.h>

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>

namespace hevcbox {

bool ValidHexStringToBytes(const std::string& hex,
                           std::vector<uint8_t>* bytes) {
  std::string raw;
  if (!ValidHexStringToBytes(hex, &raw))
    return false;

  bytes->assign(raw.begin(), raw.end());
  return true;
}

bool ValidHexStringToBytes(const std::string& hex, std::string* bytes) {
  // absl::HexStringToBytes will not validate the string!  Any invalid byte
  // sequence will be converted into NUL characters silently.  So we do our own
  // validation here.
  if (hex.size() % 2 != 0)
    return false;
  for (char c : hex) {
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c)))
      return false;
  }

  *bytes = absl::HexStringToBytes(hex);
  return true;
}

}  // namespace hevcbox
