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

#include "slidedeid/runtime/io/chunk_source.h"

#include <algorithm>
#include <utility>

namespace slidedeid {
namespace runtime {
namespace io {

MemoryChunkSource::MemoryChunkSource(std::vector<Chunk> chunks) {
  chunks_.reserve(chunks.size());
  for (auto& chunk : chunks) {
    if (!chunk.empty()) {
      chunks_.push_back(std::move(chunk));
    }
  }
}

MemoryChunkSource MemoryChunkSource::FromBytes(std::span<const uint8_t> bytes,
                                               size_t chunk_size) {
  std::vector<Chunk> chunks;
  const size_t step = std::max<size_t>(chunk_size, 1);
  for (size_t offset = 0; offset < bytes.size(); offset += step) {
    const size_t length = std::min(step, bytes.size() - offset);
    auto slice = bytes.subspan(offset, length);
    chunks.emplace_back(slice.begin(), slice.end());
  }
  return MemoryChunkSource(std::move(chunks));
}

absl::StatusOr<std::optional<Chunk>> MemoryChunkSource::Next() {
  if (next_ >= chunks_.size()) {
    return std::optional<Chunk>();
  }
  return std::optional<Chunk>(std::move(chunks_[next_++]));
}

}  // namespace io
}  // namespace runtime
}  // namespace slidedeid
