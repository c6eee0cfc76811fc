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

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace facebook::lancet {

/// A read-only file that supports positional reads. This is the only I/O
/// primitive the decoder needs from the storage layer. Implementations must
/// be safe to call concurrently.
class ReadFile {
 public:
  virtual ~ReadFile() = default;

  /// Reads the [offset, offset + length) range into 'buf', which must have
  /// room for 'length' bytes. Throws an IO_ERROR on short reads.
  virtual std::string_view pread(uint64_t offset, uint64_t length, void* buf)
      const = 0;

  /// Same as above, but returns the bytes as an owned string.
  std::string pread(uint64_t offset, uint64_t length) const;

  /// Number of bytes in the file.
  virtual uint64_t size() const = 0;

  /// Total number of bytes returned by pread() so far.
  uint64_t bytesRead() const {
    return bytesRead_;
  }

 protected:
  mutable std::atomic<uint64_t> bytesRead_ = 0;
};

/// A ReadFile backed by a string_view. The caller keeps the bytes alive.
class InMemoryReadFile final : public ReadFile {
 public:
  explicit InMemoryReadFile(std::string_view file) : file_(file) {}

  using ReadFile::pread;

  std::string_view pread(uint64_t offset, uint64_t length, void* buf)
      const override;

  uint64_t size() const override {
    return file_.size();
  }

 private:
  const std::string_view file_;
};

class LocalReadFile final : public ReadFile {
 public:
  explicit LocalReadFile(std::string_view path);

  ~LocalReadFile() override;

  using ReadFile::pread;

  std::string_view pread(uint64_t offset, uint64_t length, void* buf)
      const override;

  uint64_t size() const override;

 private:
  const std::string path_;
  int32_t fd_;
  mutable std::atomic<int64_t> size_ = -1;
};

} // namespace facebook::lancet
