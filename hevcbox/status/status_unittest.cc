// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/status.h>

#include <sstream>

#include <absl/strings/str_format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <hevcbox/macros/status.h>
#include <hevcbox/status/status_test_util.h>

namespace hevcbox {

namespace {

Status ReturnsEarly(const Status& first, bool* reached_end) {
  RETURN_IF_ERROR(first);
  *reached_end = true;
  return Status::OK;
}

}  // namespace

static void CheckStatus(const Status& s,
                        error::Code code,
                        const std::string& message) {
  EXPECT_EQ(code, s.error_code());
  EXPECT_EQ(message, s.error_message());

  if (code == error::OK) {
    EXPECT_TRUE(s.ok());
    EXPECT_EQ("OK", s.ToString());
  } else {
    EXPECT_FALSE(s.ok());
    EXPECT_THAT(s.ToString(), testing::HasSubstr(message));
    EXPECT_THAT(s.ToString(), testing::HasSubstr(absl::StrFormat("%d", code)));
  }
}

TEST(Status, Empty) {
  CheckStatus(Status(), error::OK, "");
}

TEST(Status, ConstructorOKDropsMessage) {
  CheckStatus(Status(error::OK, "msg"), error::OK, "");
}

TEST(Status, ParserFailure) {
  CheckStatus(Status(error::PARSER_FAILURE, "hvcC not found"),
              error::PARSER_FAILURE, "hvcC not found");
  EXPECT_THAT(Status(error::PARSER_FAILURE, "x").ToString(),
              testing::HasSubstr("PARSER_FAILURE"));
}

TEST(Status, EndOfStreamName) {
  EXPECT_THAT(Status(error::END_OF_STREAM, "short read").ToString(),
              testing::HasSubstr("END_OF_STREAM"));
}

TEST(Status, UpdateKeepsFirstError) {
  Status s;
  s.Update(Status::OK);
  EXPECT_OK(s);
  const Status first(error::FILE_FAILURE, "seek failed");
  s.Update(first);
  s.Update(Status(error::PARSER_FAILURE, "later"));
  EXPECT_EQ(first, s);
}

TEST(Status, StreamOperator) {
  std::ostringstream os;
  os << Status(error::INVALID_ARGUMENT, "too many NAL units");
  EXPECT_THAT(os.str(), testing::HasSubstr("INVALID_ARGUMENT"));
  EXPECT_THAT(os.str(), testing::HasSubstr("too many NAL units"));
}

TEST(Status, ReturnIfError) {
  bool reached_end = false;
  EXPECT_OK(ReturnsEarly(Status::OK, &reached_end));
  EXPECT_TRUE(reached_end);

  reached_end = false;
  EXPECT_EQ(error::END_OF_STREAM,
            ReturnsEarly(Status(error::END_OF_STREAM, "eos"), &reached_end)
                .error_code());
  EXPECT_FALSE(reached_end);
}

}  // namespace hevcbox
