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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_DEIDENTIFY_FILE_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_DEIDENTIFY_FILE_H_

#include <cstddef>
#include <filesystem>
#include <optional>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidedeid/formats/isyntax/header_inspector.h"
#include "slidedeid/runtime/io/chunk_source.h"

namespace fs = std::filesystem;

namespace slidedeid {

/// @brief Options for file deidentification
///
/// Example usage:
/// @code
/// DeidentifyFileOptions options;
/// options.chunk_size = 1 << 20;
/// options.original_header_path = "slide.header.xml";
/// RETURN_IF_ERROR(DeidentifyFile("slide.isyntax", "deid.isyntax", options),
///                 "");
/// @endcode
struct DeidentifyFileOptions {
  /// @brief Read size for the input file (and output cadence)
  size_t chunk_size = kDefaultChunkSize;

  /// @brief Where to save the untouched header bytes, if anywhere
  ///
  /// The file is created exclusively; an existing file is an error.
  std::optional<fs::path> original_header_path;
};

/// @brief Write a deidentified copy of an iSyntax file
///
/// The output is created (exclusively) only after the header has been
/// validated and rewritten, and the original header backup only after the
/// output has been created. On any failure neither file is left behind.
///
/// @param input Source slide
/// @param output Destination; must not exist
/// @param options File options
/// @retval absl::AlreadyExistsError if @p output (or the original header
///         path) already exists
/// @retval FormatError, BarcodeError, ImagesError, LabelError from the
///         deidentification itself
absl::Status DeidentifyFile(const fs::path& input, const fs::path& output,
                            const DeidentifyFileOptions& options = {});

/// @brief Deidentify an iSyntax file in place
///
/// Only the buffered prefix of the file (the header region plus any bytes
/// read past it) is written back at offset 0; the rest of the file is not
/// touched. Nothing is written unless the header transform succeeds.
///
/// @param input Slide to rewrite
/// @param options File options
absl::Status DeidentifyFileInPlace(const fs::path& input,
                                   const DeidentifyFileOptions& options = {});

/// @brief Summarize the identifying fields in the header of a file
/// @param path Slide to inspect
/// @param chunk_size Read size
absl::StatusOr<isyntax::HeaderSummary> InspectFile(
    const fs::path& path, size_t chunk_size = kDefaultChunkSize);

}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_DEIDENTIFY_FILE_H_
