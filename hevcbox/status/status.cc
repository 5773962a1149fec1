// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/status.h>

#include <ostream>
#include <utility>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <hevcbox/macros/logging.h>

namespace hevcbox {

namespace {

const char* CodeName(error::Code code) {
  switch (code) {
    case error::OK:
      return "OK";
    case error::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case error::FILE_FAILURE:
      return "FILE_FAILURE";
    case error::END_OF_STREAM:
      return "END_OF_STREAM";
    case error::PARSER_FAILURE:
      return "PARSER_FAILURE";
  }
  NOTIMPLEMENTED() << "Status code " << static_cast<int>(code);
  return "UNKNOWN";
}

}  // namespace

const Status Status::OK;

Status::Status(error::Code error_code, const std::string& error_message)
    : error_code_(error_code) {
  if (ok())
    return;
  error_message_ = error_message;
  VLOG(1) << ToString();
}

void Status::Update(Status new_status) {
  if (ok())
    *this = std::move(new_status);
}

std::string Status::ToString() const {
  if (ok())
    return "OK";
  return absl::StrFormat("%s (%d): %s", CodeName(error_code_),
                         static_cast<int>(error_code_), error_message_);
}

std::ostream& operator<<(std::ostream& os, const Status& x) {
  return os << x.ToString();
}

}  // namespace hevcbox
