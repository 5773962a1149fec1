// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_PUBLIC_STATUS_H_
#define HEVCBOX_PUBLIC_STATUS_H_

#include <iostream>
#include <string>

#include <hevcbox/export.h>

namespace hevcbox {

namespace error {

/// Error codes reported when reading or writing sample entries.
enum Code {
  OK,

  // The caller asked for something that cannot be encoded, e.g. a NAL unit
  // too large for its 16-bit length field.
  INVALID_ARGUMENT,

  // The underlying File could not be opened, read, written or positioned.
  FILE_FAILURE,

  // The data ended before the structure it declares.
  END_OF_STREAM,

  // The data is not a well-formed HEVC sample entry.
  PARSER_FAILURE,
};

}  // namespace error

class HEVCBOX_EXPORT Status {
 public:
  Status() : error_code_(error::OK) {}

  /// The message is dropped for error::OK.
  Status(error::Code error_code, const std::string& error_message);

  static const Status OK;

  /// Keep the first error: replaces *this with @a new_status only if ok().
  void Update(Status new_status);

  bool ok() const { return error_code_ == error::OK; }
  error::Code error_code() const { return error_code_; }
  const std::string& error_message() const { return error_message_; }

  bool operator==(const Status& x) const {
    return error_code_ == x.error_code() && error_message_ == x.error_message();
  }
  bool operator!=(const Status& x) const { return !(*this == x); }

  /// @return "OK", or the code name and number followed by the message.
  std::string ToString() const;

 private:
  error::Code error_code_;
  std::string error_message_;
};

std::ostream& operator<<(std::ostream& os, const Status& x);

}  // namespace hevcbox

#endif  // HEVCBOX_PUBLIC_STATUS_H_
