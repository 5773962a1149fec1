// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/utils/absl_flag_hexbytes.h>

#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include <hevcbox/utils/hex_parser.h>
#include <hevcbox/utils/string_trim_split.h>

namespace hevcbox {

namespace {

std::string BytesToHex(const std::vector<uint8_t>& bytes) {
  std::string result;
  for (const auto byte : bytes) {
    absl::StrAppendFormat(&result, "%02x", byte);
  }
  return result;
}

}  // namespace

bool AbslParseFlag(absl::string_view text, HexBytes* flag, std::string* error) {
  std::string hex_string(absl::StripAsciiWhitespace(text));

  if (hex_string.empty()) {
    flag->bytes.clear();
    return true;
  }

  if (!ValidHexStringToBytes(hex_string, &flag->bytes)) {
    *error = "Invalid hex string";
    return false;
  }
  return true;
}

std::string AbslUnparseFlag(const HexBytes& flag) {
  return BytesToHex(flag.bytes);
}

bool AbslParseFlag(absl::string_view text,
                   HexBytesList* flag,
                   std::string* error) {
  std::vector<std::vector<uint8_t>> entries;
  for (const std::string& hex_string : SplitAndTrimSkipEmpty(text, ',')) {
    std::vector<uint8_t> bytes;
    if (!ValidHexStringToBytes(hex_string, &bytes)) {
      *error = absl::StrFormat("Invalid hex string '%s'", hex_string);
      return false;
    }
    entries.push_back(std::move(bytes));
  }
  flag->entries = std::move(entries);
  return true;
}

std::string AbslUnparseFlag(const HexBytesList& flag) {
  std::vector<std::string> hex_strings;
  for (const std::vector<uint8_t>& bytes : flag.entries)
    hex_strings.push_back(BytesToHex(bytes));
  return absl::StrJoin(hex_strings, ",");
}

}  // namespace hevcbox
