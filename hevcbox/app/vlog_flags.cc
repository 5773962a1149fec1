// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/app/vlog_flags.h>

#include <algorithm>
#include <string>
#include <vector>

#include <absl/log/globals.h>
#include <absl/log/log.h>
#include <absl/strings/numbers.h>

#include <hevcbox/utils/string_trim_split.h>

ABSL_FLAG(int,
          v,
          0,
          "Show all VLOG(m) or DVLOG(m) messages for m <= this. "
          "Overridable by --vmodule.");

ABSL_FLAG(std::string,
          vmodule,
          "",
          "Per-module verbose level. Argument is a comma-separated list of "
          "<module name>=<log level>. Levels are not tracked per module, so "
          "the verbosity is set to the maximum specified for any module or "
          "given by --v.");

namespace hevcbox {

void handle_vlog_flags() {
  int vlog_level = absl::GetFlag(FLAGS_v);

  for (const std::string& pattern :
       SplitAndTrimSkipEmpty(absl::GetFlag(FLAGS_vmodule), ',')) {
    const size_t pos = pattern.find('=');
    if (pos == std::string::npos) {
      LOG(ERROR) << "Missing log level in --vmodule entry '" << pattern << "'";
      continue;
    }
    int pattern_vlevel = 0;
    if (!absl::SimpleAtoi(pattern.substr(pos + 1), &pattern_vlevel)) {
      LOG(ERROR) << "Error parsing log level for '" << pattern.substr(0, pos)
                 << "' from '" << pattern.substr(pos + 1) << "'";
      continue;
    }
    vlog_level = std::max(vlog_level, pattern_vlevel);
  }

  if (vlog_level != 0)
    absl::SetGlobalVLogLevel(vlog_level);
}

}  // namespace hevcbox
