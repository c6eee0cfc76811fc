/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "lancet/common/file/File.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <glog/logging.h>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet {

std::string ReadFile::pread(uint64_t offset, uint64_t length) const {
  std::string result(length, 0);
  pread(offset, length, result.data());
  return result;
}

std::string_view
InMemoryReadFile::pread(uint64_t offset, uint64_t length, void* buf) const {
  if (offset > file_.size() || length > file_.size() - offset) {
    LANCET_IO_ERROR(
        "Read past end of in-memory file: offset {} length {} size {}",
        offset,
        length,
        file_.size());
  }
  bytesRead_ += length;
  if (length > 0) {
    std::memcpy(buf, file_.data() + offset, length);
  }
  return {static_cast<char*>(buf), length};
}

LocalReadFile::LocalReadFile(std::string_view path) : path_(path) {
  fd_ = open(path_.c_str(), O_RDONLY);
  if (fd_ < 0) {
    LANCET_IO_ERROR("open failure for '{}': {}", path_, strerror(errno));
  }
}

LocalReadFile::~LocalReadFile() {
  if (fd_ >= 0 && close(fd_) != 0) {
    // We cannot throw an exception from the destructor. Warn instead.
    LOG(WARNING) << "close failure in LocalReadFile destructor for " << path_;
  }
}

std::string_view
LocalReadFile::pread(uint64_t offset, uint64_t length, void* buf) const {
  auto* pos = static_cast<char*>(buf);
  uint64_t remaining = length;
  while (remaining > 0) {
    const auto bytesRead = ::pread(fd_, pos, remaining, offset);
    if (bytesRead < 0 && errno == EINTR) {
      continue;
    }
    if (bytesRead <= 0) {
      LANCET_IO_ERROR(
          "pread failure for '{}' at offset {}: expected {} more bytes",
          path_,
          offset,
          remaining);
    }
    pos += bytesRead;
    offset += bytesRead;
    remaining -= bytesRead;
  }
  bytesRead_ += length;
  return {static_cast<char*>(buf), length};
}

uint64_t LocalReadFile::size() const {
  if (size_ != -1) {
    return size_;
  }
  const off_t rc = lseek(fd_, 0, SEEK_END);
  if (rc < 0) {
    LANCET_IO_ERROR("lseek failure for '{}': {}", path_, strerror(errno));
  }
  size_ = rc;
  return size_;
}

} // namespace facebook::lancet
