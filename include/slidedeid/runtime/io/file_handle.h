// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_HANDLE_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_HANDLE_H_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace slidedeid {
namespace runtime {
namespace io {

/// @brief RAII wrapper for FILE* operations
///
/// Owns the handle and closes it on destruction. All operations report
/// failures as traced statuses instead of errno checks at the call site.
///
/// Example usage:
/// ```cpp
/// FileHandle out;
/// ASSIGN_OR_RETURN_MOVE(out, FileHandle::Open(path, "wbx"));
/// RETURN_IF_ERROR(out.Write(data.data(), data.size()), "");
/// RETURN_IF_ERROR(out.Flush(), "");
/// ```
class FileHandle {
 public:
  /// @brief Default constructor (creates invalid handle)
  FileHandle() : file_(nullptr, fclose) {}

  /// @brief Open a file
  /// @param path Path to file
  /// @param mode fopen mode ("rb", "r+b", "wbx", ...)
  /// @return FileHandle instance or error
  /// @retval absl::NotFoundError if the file does not exist
  /// @retval absl::AlreadyExistsError if "x" was requested and the file exists
  /// @retval absl::PermissionDeniedError if access is denied
  static absl::StatusOr<FileHandle> Open(const fs::path& path,
                                         const char* mode);

  FileHandle(FileHandle&& other) noexcept = default;
  FileHandle& operator=(FileHandle&& other) noexcept = default;
  ~FileHandle() = default;

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  /// @brief Get raw FILE pointer (null for a default-constructed handle)
  FILE* Get() const { return file_.get(); }

  /// @brief Seek to position in file
  /// @param offset Byte offset
  /// @param whence SEEK_SET, SEEK_CUR, or SEEK_END
  absl::Status Seek(int64_t offset, int whence = SEEK_SET) const;

  /// @brief Get current file position
  absl::StatusOr<int64_t> Tell() const;

  /// @brief Read up to @p size bytes
  /// @return Number of bytes read; 0 only at end of file
  absl::StatusOr<size_t> ReadSome(void* buffer, size_t size) const;

  /// @brief Write exactly @p size bytes
  absl::Status Write(const void* buffer, size_t size) const;

  /// @brief Flush buffered writes to the operating system
  absl::Status Flush() const;

 private:
  explicit FileHandle(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

}  // namespace io
}  // namespace runtime

using runtime::io::FileHandle;

}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_HANDLE_H_
