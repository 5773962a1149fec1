// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MEDIA_BASE_FIXED_POINT_H_
#define HEVCBOX_MEDIA_BASE_FIXED_POINT_H_

#include <cstdint>

namespace hevcbox {
namespace media {

/// An unsigned fixed-point 16.16 value, as used for resolutions and
/// presentation sizes in ISO BMFF. The raw 32-bit representation is what goes
/// on the wire.
class FixedPoint16 {
 public:
  FixedPoint16() : raw_value_(0) {}
  explicit FixedPoint16(double value)
      : raw_value_(static_cast<uint32_t>(value * 0x10000 + 0.5)) {}

  static FixedPoint16 FromRaw(uint32_t raw_value) {
    FixedPoint16 fixed_point;
    fixed_point.raw_value_ = raw_value;
    return fixed_point;
  }

  uint32_t raw_value() const { return raw_value_; }
  double value() const { return static_cast<double>(raw_value_) / 0x10000; }

  bool operator==(const FixedPoint16& other) const {
    return raw_value_ == other.raw_value_;
  }
  bool operator!=(const FixedPoint16& other) const {
    return !(*this == other);
  }

 private:
  uint32_t raw_value_;
};

}  // namespace media
}  // namespace hevcbox

#endif  // HEVCBOX_MEDIA_BASE_FIXED_POINT_H_
