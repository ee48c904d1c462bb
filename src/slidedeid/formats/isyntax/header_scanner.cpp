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

#include "slidedeid/formats/isyntax/header_scanner.h"

#include <algorithm>
#include <iterator>
#include <optional>

#include "absl/log/log.h"
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/isyntax_constants.h"

namespace slidedeid {
namespace isyntax {

absl::StatusOr<HeaderLocation> FindHeader(ChunkSource& source,
                                          std::vector<uint8_t>& buffer) {
  HeaderLocation location;
  size_t terminator_pos = buffer.size();

  while (terminator_pos == buffer.size()) {
    auto next = source.Next();
    if (!next.ok()) {
      return next.status();
    }
    if (!next->has_value()) {
      return FormatError("Header not found");
    }

    const Chunk& chunk = **next;
    if (location.chunk_size == 0) {
      location.chunk_size = chunk.size();
    }

    const size_t start = buffer.size();
    buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    terminator_pos = std::find(buffer.begin() + start, buffer.end(),
                               constants::kHeaderTerminator) -
                     buffer.begin();
  }

  const size_t prefix_size = constants::kTerminatorPrefix.size();
  if (terminator_pos < prefix_size ||
      !std::equal(constants::kTerminatorPrefix.begin(),
                  constants::kTerminatorPrefix.end(),
                  buffer.begin() + (terminator_pos - prefix_size))) {
    return FormatError("Error decoding header");
  }

  // The XML text ends at the last '>' before the CR LF.
  const auto text_end = buffer.begin() + (terminator_pos - prefix_size);
  const auto last_tag_close = std::find(std::make_reverse_iterator(text_end),
                                        buffer.rend(), constants::kTagClose);
  if (last_tag_close == buffer.rend()) {
    return FormatError("Error decoding header");
  }
  location.header_size = last_tag_close.base() - buffer.begin();

  VLOG(1) << "Found header of " << location.header_size
          << " bytes, terminator at offset " << terminator_pos
          << ", chunk size " << location.chunk_size << ", "
          << buffer.size() - terminator_pos - 1
          << " payload bytes already buffered";
  return location;
}

}  // namespace isyntax
}  // namespace slidedeid
