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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCANNER_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCANNER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "slidedeid/runtime/io/chunk_source.h"

namespace slidedeid {
namespace isyntax {

/// @brief Where the XML header ends within the buffered stream prefix
struct HeaderLocation {
  size_t header_size = 0;  ///< Bytes of XML text, from offset 0 to the last '>'
  size_t chunk_size = 0;   ///< Length of the first chunk pulled from the source
};

/// @brief Pull chunks until the header terminator (CR LF EOT) is found
///
/// Every chunk is appended to @p buffer and only the newly appended bytes are
/// searched, so scanning is linear in the header size regardless of the
/// chunking. On success @p buffer holds at least `header_size` bytes; any
/// bytes after the terminator belong to the binary payload and are left in
/// place for replay.
///
/// @param source Chunk source positioned at the start of the file
/// @param buffer Accumulation buffer; expected to be empty on entry
/// @return Header location
/// @retval FormatError "Header not found" if @p source is exhausted first
/// @retval FormatError "Error decoding header" if the EOT is not preceded by
///         CR LF, or no '>' precedes the terminator
absl::StatusOr<HeaderLocation> FindHeader(ChunkSource& source,
                                          std::vector<uint8_t>& buffer);

}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCANNER_H_
