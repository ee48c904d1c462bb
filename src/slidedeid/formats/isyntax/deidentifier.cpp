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

#include "slidedeid/formats/isyntax/deidentifier.h"

#include <span>
#include <utility>

#include "absl/log/log.h"
#include "slidedeid/formats/isyntax/header_scanner.h"
#include "slidedeid/formats/isyntax/header_transform.h"

namespace slidedeid {
namespace isyntax {

absl::StatusOr<DeidentifyResult> Deidentify(
    std::unique_ptr<ChunkSource> source, const DeidentifyOptions& options) {
  std::vector<uint8_t> buffer;
  auto location = FindHeader(*source, buffer);
  if (!location.ok()) {
    return location.status();
  }

  DeidentifyResult result;
  result.header_size = location->header_size;

  std::span<uint8_t> header(buffer.data(), location->header_size);
  if (options.keep_original_header) {
    result.original_header.emplace(header.begin(), header.end());
  }

  absl::Status status = DeidentifyHeaderInPlace(header);
  if (!status.ok()) {
    return status;
  }

  const size_t slice_size =
      options.chunk_output_mode == ChunkOutputMode::kRechunk
          ? location->chunk_size
          : 0;
  VLOG(1) << "Header rewritten, replaying " << buffer.size()
          << " buffered bytes"
          << (slice_size == 0 ? " as a single chunk" : " in chunks");

  result.stream = std::make_unique<DeidentifiedStream>(
      std::move(buffer), slice_size, std::move(source));
  return result;
}

}  // namespace isyntax
}  // namespace slidedeid
