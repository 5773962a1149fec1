// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HEVCBOX_MACROS_CLASSES_H_
#define HEVCBOX_MACROS_CLASSES_H_

/// Deletes the copy constructor and copy assignment of |TypeName|. Put it in
/// the private section of readers, writers and files that own a position or
/// a stream.
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;      \
  TypeName& operator=(const TypeName&) = delete

#endif  // HEVCBOX_MACROS_CLASSES_H_
