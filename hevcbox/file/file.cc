// Copyright 2014 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/file.h>

#include <memory>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>

#include <hevcbox/file/file_closer.h>
#include <hevcbox/file/local_file.h>
#include <hevcbox/file/memory_file.h>

namespace hevcbox {

const char* kLocalFilePrefix = "file://";
const char* kMemoryFilePrefix = "memory://";

namespace {

const size_t kReadChunkSize = 0x10000;

enum class FileType { kLocal, kMemory };

// Strips the type prefix off |file_name|.
FileType GetFileType(absl::string_view file_name, std::string* path) {
  FileType type = FileType::kLocal;
  if (absl::ConsumePrefix(&file_name, kMemoryFilePrefix)) {
    type = FileType::kMemory;
  } else {
    absl::ConsumePrefix(&file_name, kLocalFilePrefix);
  }
  path->assign(file_name.data(), file_name.size());
  return type;
}

}  // namespace

File* File::Open(const char* file_name, const char* mode) {
  DCHECK(file_name);
  DCHECK(mode);
  std::string path;
  File* file = NULL;
  switch (GetFileType(file_name, &path)) {
    case FileType::kLocal:
      file = new LocalFile(path.c_str(), mode);
      break;
    case FileType::kMemory:
      file = new MemoryFile(path, mode);
      break;
  }
  if (!file->Open()) {
    VLOG(1) << "Cannot open '" << file_name << "' with mode '" << mode << "'.";
    delete file;
    return NULL;
  }
  return file;
}

bool File::Delete(const char* file_name) {
  std::string path;
  if (GetFileType(file_name, &path) == FileType::kMemory)
    return MemoryFile::Delete(path);
  return LocalFile::Delete(path.c_str());
}

bool File::ReadFileToString(const char* file_name, std::string* contents) {
  DCHECK(contents);
  std::unique_ptr<File, FileCloser> file(File::Open(file_name, "r"));
  if (!file)
    return false;

  contents->clear();
  char chunk[kReadChunkSize];
  while (true) {
    const int64_t bytes_read = file->Read(chunk, sizeof(chunk));
    if (bytes_read < 0) {
      LOG(ERROR) << "Read error in " << file_name;
      return false;
    }
    if (bytes_read == 0)
      return true;
    contents->append(chunk, static_cast<size_t>(bytes_read));
  }
}

bool File::WriteStringToFile(const char* file_name,
                             const std::string& contents) {
  std::unique_ptr<File, FileCloser> file(File::Open(file_name, "w"));
  if (!file) {
    LOG(ERROR) << "Cannot open " << file_name << " for writing.";
    return false;
  }
  const int64_t bytes_written = file->Write(contents.data(), contents.size());
  if (bytes_written != static_cast<int64_t>(contents.size())) {
    LOG(ERROR) << "Wrote " << bytes_written << " of " << contents.size()
               << " bytes to " << file_name << ".";
    return false;
  }
  if (!file.release()->Close()) {
    LOG(ERROR) << "Cannot close " << file_name << ".";
    return false;
  }
  return true;
}

}  // namespace hevcbox
