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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIED_STREAM_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIED_STREAM_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "slidedeid/runtime/io/chunk_source.h"

namespace slidedeid {
namespace isyntax {

/// @brief Output stream of a deidentified file
///
/// First replays the buffered stream prefix (the rewritten header followed by
/// whatever payload bytes were read past the terminator) in slices of a
/// fixed size, then forwards the remaining upstream chunks verbatim.
///
/// The stream is lazy and single-pass: each Next() pulls at most one upstream
/// chunk, and once the upstream is exhausted the stream stays exhausted
/// without touching the upstream again. The replay buffer is released as
/// soon as it has been emitted.
class DeidentifiedStream : public ChunkSource {
 public:
  /// @brief Construct the stream
  /// @param buffer Buffered prefix of the stream, header already rewritten
  /// @param slice_size Replay slice size; 0 replays the buffer as one chunk
  /// @param upstream Source of the bytes following @p buffer
  DeidentifiedStream(std::vector<uint8_t> buffer, size_t slice_size,
                     std::unique_ptr<ChunkSource> upstream);

  absl::StatusOr<std::optional<Chunk>> Next() override;

 private:
  enum class Phase {
    kReplayingBuffer,     ///< Emitting slices of buffer_
    kForwardingUpstream,  ///< Emitting upstream chunks
    kExhausted,           ///< Upstream reported end of stream
  };

  Phase phase_;
  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
  size_t slice_size_;
  std::unique_ptr<ChunkSource> upstream_;
};

}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIED_STREAM_H_
