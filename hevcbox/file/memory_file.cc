// Copyright 2015 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hevcbox/file/memory_file.h>

#include <algorithm>
#include <cstring>
#include <map>

#include <absl/base/thread_annotations.h>
#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/synchronization/mutex.h>

#include <hevcbox/macros/logging.h>

namespace hevcbox {
namespace {

struct MemoryFileEntry {
  std::vector<uint8_t> data;
  bool open = false;
};

// Contents of all memory files, by name. Entries are never moved once
// created, so open files may hold on to their data.
class MemoryFileStore {
 public:
  static MemoryFileStore* Get() {
    static MemoryFileStore* store = new MemoryFileStore;
    return store;
  }

  std::vector<uint8_t>* Acquire(const std::string& name,
                                const std::string& mode) {
    absl::MutexLock lock(&mutex_);
    if (mode != "r" && mode != "w") {
      NOTIMPLEMENTED() << "Memory file mode '" << mode << "'.";
      return NULL;
    }
    auto iter = entries_.find(name);
    if (iter == entries_.end()) {
      if (mode == "r")
        return NULL;
      iter = entries_.emplace(name, MemoryFileEntry()).first;
    }
    if (iter->second.open) {
      NOTIMPLEMENTED() << "Memory file '" << name << "' opened twice.";
      return NULL;
    }
    iter->second.open = true;
    if (mode == "w")
      iter->second.data.clear();
    return &iter->second.data;
  }

  bool Release(const std::string& name) {
    absl::MutexLock lock(&mutex_);
    auto iter = entries_.find(name);
    if (iter == entries_.end() || !iter->second.open) {
      LOG(ERROR) << "Memory file '" << name << "' is not open.";
      return false;
    }
    iter->second.open = false;
    return true;
  }

  bool Erase(const std::string& name) {
    absl::MutexLock lock(&mutex_);
    auto iter = entries_.find(name);
    if (iter == entries_.end())
      return true;
    if (iter->second.open) {
      LOG(ERROR) << "Cannot delete open memory file '" << name << "'.";
      return false;
    }
    entries_.erase(iter);
    return true;
  }

  void Clear() {
    absl::MutexLock lock(&mutex_);
    for (const auto& entry : entries_) {
      if (entry.second.open) {
        LOG(ERROR) << "Memory file '" << entry.first
                   << "' is still open; nothing deleted.";
        return;
      }
    }
    entries_.clear();
  }

 private:
  MemoryFileStore() = default;

  absl::Mutex mutex_;
  std::map<std::string, MemoryFileEntry> entries_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace

MemoryFile::MemoryFile(const std::string& file_name, const std::string& mode)
    : File(file_name), mode_(mode), data_(NULL), position_(0) {}

MemoryFile::~MemoryFile() {}

bool MemoryFile::Open() {
  data_ = MemoryFileStore::Get()->Acquire(file_name(), mode_);
  position_ = 0;
  return data_ != NULL;
}

bool MemoryFile::Close() {
  const bool released = MemoryFileStore::Get()->Release(file_name());
  delete this;
  return released;
}

int64_t MemoryFile::Read(void* buffer, uint64_t length) {
  DCHECK(data_);
  if (position_ >= data_->size())
    return 0;
  const uint64_t count = std::min<uint64_t>(length, data_->size() - position_);
  memcpy(buffer, data_->data() + position_, count);
  position_ += count;
  return static_cast<int64_t>(count);
}

int64_t MemoryFile::Write(const void* buffer, uint64_t length) {
  DCHECK(data_);
  if (mode_ != "w") {
    LOG(ERROR) << "Memory file '" << file_name() << "' is read-only.";
    return -1;
  }
  if (length == 0)
    return 0;
  if (data_->size() < position_ + length)
    data_->resize(position_ + length);
  memcpy(data_->data() + position_, buffer, length);
  position_ += length;
  return static_cast<int64_t>(length);
}

int64_t MemoryFile::Size() {
  DCHECK(data_);
  return static_cast<int64_t>(data_->size());
}

bool MemoryFile::Seek(uint64_t position) {
  DCHECK(data_);
  if (position > data_->size())
    return false;
  position_ = position;
  return true;
}

bool MemoryFile::Tell(uint64_t* position) {
  *position = position_;
  return true;
}

// static
void MemoryFile::DeleteAll() {
  MemoryFileStore::Get()->Clear();
}

// static
bool MemoryFile::Delete(const std::string& file_name) {
  return MemoryFileStore::Get()->Erase(file_name);
}

}  // namespace hevcbox
