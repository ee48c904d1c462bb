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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIER_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "slidedeid/formats/isyntax/deidentified_stream.h"
#include "slidedeid/runtime/io/chunk_source.h"

namespace slidedeid {
namespace isyntax {

/// @brief How the buffered prefix of the stream is emitted
enum class ChunkOutputMode {
  kRechunk,      ///< Slices of the nominal (first chunk) size
  kSingleChunk,  ///< One chunk holding the whole buffered prefix
};

/// @brief Options for Deidentify()
///
/// Example usage:
/// @code
/// DeidentifyOptions options;
/// options.chunk_output_mode = ChunkOutputMode::kSingleChunk;
/// options.keep_original_header = true;
/// auto result = Deidentify(std::move(source), options);
/// @endcode
struct DeidentifyOptions {
  /// @brief Output cadence of the rewritten prefix
  ChunkOutputMode chunk_output_mode = ChunkOutputMode::kRechunk;

  /// @brief Return a copy of the header bytes as they were before rewriting
  bool keep_original_header = false;
};

/// @brief Result of a successful Deidentify()
struct DeidentifyResult {
  /// @brief Deidentified byte stream; owns the upstream source
  std::unique_ptr<DeidentifiedStream> stream;

  /// @brief Untouched header bytes (only with keep_original_header)
  std::optional<std::vector<uint8_t>> original_header;

  /// @brief Length of the header region that was rewritten
  size_t header_size = 0;
};

/// @brief Deidentify an iSyntax byte stream
///
/// Reads @p source until the header terminator, rewrites the header in
/// memory and returns a lazy stream producing the deidentified file. The
/// header is fully validated before the stream exists, so a failure never
/// leaves partial output behind. Errors of the scanner and of the header
/// transform are returned unchanged.
///
/// @param source Stream of the file, starting at offset 0
/// @param options Output options
/// @return Stream and optional original header, or the first error
absl::StatusOr<DeidentifyResult> Deidentify(
    std::unique_ptr<ChunkSource> source, const DeidentifyOptions& options = {});

}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_DEIDENTIFIER_H_
