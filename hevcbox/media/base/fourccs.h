// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef HEVCBOX_MEDIA_BASE_FOURCCS_H_
#define HEVCBOX_MEDIA_BASE_FOURCCS_H_

#include <cstdint>
#include <string>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>

namespace hevcbox {
namespace media {

/// Box types and sample entry formats handled by hevcbox.
enum FourCC : uint32_t {
  FOURCC_NULL = 0,

  FOURCC_avc1 = 0x61766331,
  FOURCC_free = 0x66726565,
  FOURCC_hev1 = 0x68657631,
  FOURCC_hvc1 = 0x68766331,
  FOURCC_hvcC = 0x68766343,
  FOURCC_skip = 0x736b6970,
};

/// @return The four characters of @a fourcc, or its hex value if any of
///         them is not printable.
inline std::string FourCCToString(FourCC fourcc) {
  std::string name;
  for (int shift = 24; shift >= 0; shift -= 8) {
    const char c = static_cast<char>((fourcc >> shift) & 0xFF);
    if (!absl::ascii_isprint(static_cast<unsigned char>(c)))
      return absl::StrFormat("0x%08x", static_cast<uint32_t>(fourcc));
    name.push_back(c);
  }
  return name;
}

}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_BASE_FOURCCS_H_
