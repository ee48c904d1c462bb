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

#include "slidedeid/formats/isyntax/deidentified_stream.h"

#include <algorithm>
#include <utility>

namespace slidedeid {
namespace isyntax {

DeidentifiedStream::DeidentifiedStream(std::vector<uint8_t> buffer,
                                       size_t slice_size,
                                       std::unique_ptr<ChunkSource> upstream)
    : phase_(buffer.empty() ? Phase::kForwardingUpstream
                            : Phase::kReplayingBuffer),
      buffer_(std::move(buffer)),
      slice_size_(slice_size == 0 ? buffer_.size() : slice_size),
      upstream_(std::move(upstream)) {}

absl::StatusOr<std::optional<Chunk>> DeidentifiedStream::Next() {
  switch (phase_) {
    case Phase::kReplayingBuffer: {
      const size_t length = std::min(slice_size_, buffer_.size() - offset_);
      const bool last_slice = offset_ + length == buffer_.size();
      Chunk chunk;
      if (offset_ == 0 && last_slice) {
        chunk = std::move(buffer_);
      } else {
        chunk.assign(buffer_.begin() + offset_,
                     buffer_.begin() + offset_ + length);
      }
      offset_ += length;

      if (last_slice) {
        phase_ = Phase::kForwardingUpstream;
        std::vector<uint8_t>().swap(buffer_);
        offset_ = 0;
      }
      return std::optional<Chunk>(std::move(chunk));
    }

    case Phase::kForwardingUpstream: {
      if (!upstream_) {
        phase_ = Phase::kExhausted;
        return std::optional<Chunk>();
      }
      auto next = upstream_->Next();
      if (!next.ok()) {
        return next.status();
      }
      if (!next->has_value()) {
        phase_ = Phase::kExhausted;
      }
      return next;
    }

    case Phase::kExhausted:
      break;
  }
  return std::optional<Chunk>();
}

}  // namespace isyntax
}  // namespace slidedeid
