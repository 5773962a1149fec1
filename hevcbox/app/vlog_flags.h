// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd
//
// Defines verbose logging flags.

#ifndef HEVCBOX_APP_VLOG_FLAGS_H_
#define HEVCBOX_APP_VLOG_FLAGS_H_

#include <string>

#include <absl/flags/declare.h>
#include <absl/flags/flag.h>

ABSL_DECLARE_FLAG(int, v);
ABSL_DECLARE_FLAG(std::string, vmodule);

namespace hevcbox {

/// Applies --v and --vmodule to the absl logging globals. Must be called
/// after the command line is parsed.
void handle_vlog_flags();

}  // namespace hevcbox

#endif  // HEVCBOX_APP_VLOG_FLAGS_H_
