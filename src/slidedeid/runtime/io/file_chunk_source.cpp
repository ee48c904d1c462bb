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

#include "slidedeid/runtime/io/file_chunk_source.h"

#include <algorithm>
#include <utility>

#include "slidedeid/status/status_macros.h"

namespace slidedeid {
namespace runtime {
namespace io {

FileChunkSource::FileChunkSource(const FileHandle& file, size_t chunk_size)
    : file_(file), chunk_size_(std::max<size_t>(chunk_size, 1)) {}

absl::StatusOr<std::optional<Chunk>> FileChunkSource::Next() {
  if (exhausted_) {
    return std::optional<Chunk>();
  }

  Chunk chunk(chunk_size_);
  size_t filled = 0;
  // fread may come up short on pipes; keep reading until the chunk is full so
  // that only the final chunk is shorter than the nominal size.
  while (filled < chunk.size()) {
    size_t read = 0;
    ASSIGN_OR_RETURN(read,
                     file_.ReadSome(chunk.data() + filled, chunk.size() - filled),
                     "Failed to read chunk");
    if (read == 0) {
      exhausted_ = true;
      break;
    }
    filled += read;
  }

  if (filled == 0) {
    return std::optional<Chunk>();
  }
  chunk.resize(filled);
  return std::optional<Chunk>(std::move(chunk));
}

}  // namespace io
}  // namespace runtime
}  // namespace slidedeid
