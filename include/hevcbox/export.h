// Copyright 2017 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_PUBLIC_EXPORT_H_
#define HEVCBOX_PUBLIC_EXPORT_H_

#if defined(SHARED_LIBRARY_BUILD)
#if defined(_WIN32)

#if defined(HEVCBOX_IMPLEMENTATION)
#define HEVCBOX_EXPORT __declspec(dllexport)
#else
#define HEVCBOX_EXPORT __declspec(dllimport)
#endif  // defined(HEVCBOX_IMPLEMENTATION)

#else  // defined(_WIN32)

#if defined(HEVCBOX_IMPLEMENTATION)
#define HEVCBOX_EXPORT __attribute__((visibility("default")))
#else
#define HEVCBOX_EXPORT
#endif

#endif  // defined(_WIN32)

#else  // defined(SHARED_LIBRARY_BUILD)
#define HEVCBOX_EXPORT
#endif  // defined(SHARED_LIBRARY_BUILD)

#endif  // HEVCBOX_PUBLIC_EXPORT_H_
