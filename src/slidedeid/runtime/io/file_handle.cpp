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

#include "slidedeid/runtime/io/file_handle.h"

#include <sys/types.h>

#include <cerrno>
#include <cstring>

#include "absl/strings/str_format.h"
#include "slidedeid/status/status_macros.h"

namespace slidedeid {
namespace runtime {
namespace io {

namespace {

absl::StatusCode OpenErrorCode(int error) {
  switch (error) {
    case ENOENT:
    case ENOTDIR:
      return absl::StatusCode::kNotFound;
    case EEXIST:
      return absl::StatusCode::kAlreadyExists;
    case EACCES:
    case EPERM:
    case EROFS:
      return absl::StatusCode::kPermissionDenied;
    default:
      return absl::StatusCode::kUnavailable;
  }
}

}  // namespace

absl::StatusOr<FileHandle> FileHandle::Open(const fs::path& path,
                                            const char* mode) {
  errno = 0;
  FILE* file = fopen(path.string().c_str(), mode);
  if (!file) {
    const int error = errno;
    return MAKE_STATUS(OpenErrorCode(error),
                       absl::StrFormat("Cannot open file: %s (%s)",
                                       path.string(), std::strerror(error)));
  }
  return FileHandle(file);
}

absl::Status FileHandle::Seek(int64_t offset, int whence) const {
  if (fseeko(file_.get(), static_cast<off_t>(offset), whence) != 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        absl::StrFormat("Failed to seek to offset %d", offset));
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> FileHandle::Tell() const {
  const int64_t pos = ftello(file_.get());
  if (pos < 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to get file position");
  }
  return pos;
}

absl::StatusOr<size_t> FileHandle::ReadSome(void* buffer, size_t size) const {
  const size_t read = fread(buffer, 1, size, file_.get());
  if (read < size && ferror(file_.get())) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       absl::StrFormat("Failed to read %zu bytes", size));
  }
  return read;
}

absl::Status FileHandle::Write(const void* buffer, size_t size) const {
  if (fwrite(buffer, 1, size, file_.get()) != size) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       absl::StrFormat("Failed to write %zu bytes", size));
  }
  return absl::OkStatus();
}

absl::Status FileHandle::Flush() const {
  if (fflush(file_.get()) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal, "Failed to flush file");
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace runtime
}  // namespace slidedeid
