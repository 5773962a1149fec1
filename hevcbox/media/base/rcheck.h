// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef HEVCBOX_MEDIA_BASE_RCHECK_H_
#define HEVCBOX_MEDIA_BASE_RCHECK_H_

#include <absl/log/log.h>

/// Evaluate @a x in a function returning bool; on failure, log the failed
/// expression and return false.
#define RCHECK(x)                                    \
  do {                                               \
    if (!(x)) {                                      \
      LOG(ERROR) << "Box data check failed: " << #x; \
      return false;                                  \
    }                                                \
  } while (0)

#endif  // HEVCBOX_MEDIA_BASE_RCHECK_H_
