// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_STATUS_TEST_UTIL_H_
#define HEVCBOX_STATUS_TEST_UTIL_H_

#include <gtest/gtest.h>

#include <hevcbox/status.h>

#define EXPECT_OK(val) EXPECT_EQ(hevcbox::Status::OK, (val))
#define ASSERT_OK(val) ASSERT_EQ(hevcbox::Status::OK, (val))

// Compares only the error code; the message is free text.
#define EXPECT_ERROR_CODE(code, val) EXPECT_EQ((code), (val).error_code())

#endif  // HEVCBOX_STATUS_TEST_UTIL_H_
