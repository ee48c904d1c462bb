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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_CHUNK_SOURCE_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_CHUNK_SOURCE_H_

#include <cstddef>
#include <optional>

#include "absl/status/statusor.h"
#include "slidedeid/runtime/io/chunk_source.h"
#include "slidedeid/runtime/io/file_handle.h"

namespace slidedeid {
namespace runtime {
namespace io {

/// @brief Chunk source reading a file from its current position
///
/// The source borrows the handle: the caller keeps the FileHandle alive for
/// as long as chunks are pulled, and may keep using it afterwards (the
/// in-place rewrite seeks back and writes through the same handle).
class FileChunkSource : public ChunkSource {
 public:
  /// @param file Open handle, positioned where streaming should start
  /// @param chunk_size Bytes per read; must be positive
  FileChunkSource(const FileHandle& file, size_t chunk_size);

  absl::StatusOr<std::optional<Chunk>> Next() override;

 private:
  const FileHandle& file_;
  size_t chunk_size_;
  bool exhausted_ = false;
};

}  // namespace io
}  // namespace runtime

using runtime::io::FileChunkSource;

}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_FILE_CHUNK_SOURCE_H_
