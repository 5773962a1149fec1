// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MACROS_LOGGING_H_
#define HEVCBOX_MACROS_LOGGING_H_

#include <absl/log/log.h>

/// Logs an error for input that is well formed but not handled, such as a
/// box that extends to the end of the file. Details can be streamed in:
///   NOTIMPLEMENTED() << "Mode " << mode;
#define NOTIMPLEMENTED() LOG(ERROR) << "Not implemented in " << __func__ << ": "

#endif  // HEVCBOX_MACROS_LOGGING_H_
