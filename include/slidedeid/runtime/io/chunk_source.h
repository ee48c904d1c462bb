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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_CHUNK_SOURCE_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_CHUNK_SOURCE_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "absl/status/statusor.h"

namespace slidedeid {

/// @brief A block of bytes pulled from (or pushed into) a chunk stream
using Chunk = std::vector<uint8_t>;

/// @brief Read size used when a file is streamed without an explicit size
inline constexpr size_t kDefaultChunkSize = 8192;

namespace runtime {
namespace io {

/// @brief Pull-based, single-pass source of byte chunks
///
/// Every chunk except possibly the last has the same length; the length of
/// the first chunk is the stream's nominal chunk size. Implementations never
/// yield empty chunks.
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  /// @brief Pull the next chunk
  /// @return The chunk, std::nullopt once the stream is exhausted, or an
  ///         error from the underlying storage
  virtual absl::StatusOr<std::optional<Chunk>> Next() = 0;
};

/// @brief Chunk source over chunks held in memory
///
/// Mostly used by tests and by callers that already have the bytes at hand.
class MemoryChunkSource : public ChunkSource {
 public:
  /// @brief Serve @p chunks in order; empty chunks are skipped
  explicit MemoryChunkSource(std::vector<Chunk> chunks);

  /// @brief Split @p bytes into consecutive chunks of @p chunk_size
  /// @param bytes Stream contents
  /// @param chunk_size Chunk length (the last chunk may be shorter); must be
  ///        positive
  static MemoryChunkSource FromBytes(std::span<const uint8_t> bytes,
                                     size_t chunk_size);

  absl::StatusOr<std::optional<Chunk>> Next() override;

  /// @brief Number of chunks handed out so far
  size_t GetPullCount() const { return next_; }

 private:
  std::vector<Chunk> chunks_;
  size_t next_ = 0;
};

}  // namespace io
}  // namespace runtime

using runtime::io::ChunkSource;
using runtime::io::MemoryChunkSource;

}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_RUNTIME_IO_CHUNK_SOURCE_H_
