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

/// @file deidentify_file.cpp
/// @brief File-level deidentification of iSyntax slides
///
/// Two ways of applying the header rewrite:
/// - copy: the whole file is streamed through the deidentifier into a new
///   file, re-chunked at the read size;
/// - in place: the deidentifier runs in single-chunk mode and only its first
///   chunk (header region plus the bytes read past it) is written back at
///   offset 0.
/// In both cases nothing is created or written before the header has been
/// validated and rewritten in memory.

#include "slidedeid/deidentify_file.h"

#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "slidedeid/formats/isyntax/deidentifier.h"
#include "slidedeid/formats/isyntax/header_scanner.h"
#include "slidedeid/runtime/io/file_chunk_source.h"
#include "slidedeid/runtime/io/file_handle.h"
#include "slidedeid/status/status_macros.h"

namespace slidedeid {

namespace {

absl::Status WriteNewFile(const fs::path& path,
                          std::span<const uint8_t> bytes) {
  FileHandle file;
  ASSIGN_OR_RETURN_MOVE(file, FileHandle::Open(path, "wbx"));
  RETURN_IF_ERROR(file.Write(bytes.data(), bytes.size()), path.string());
  RETURN_IF_ERROR(file.Flush(), path.string());
  return absl::OkStatus();
}

absl::Status SaveOriginalHeader(const isyntax::DeidentifyResult& result,
                                const DeidentifyFileOptions& options) {
  if (!options.original_header_path.has_value() ||
      !result.original_header.has_value()) {
    return absl::OkStatus();
  }
  RETURN_IF_ERROR(
      WriteNewFile(*options.original_header_path, *result.original_header),
      "Failed to save original header");
  LOG(INFO) << "Saved original header (" << result.original_header->size()
            << " bytes) to " << options.original_header_path->string();
  return absl::OkStatus();
}

absl::Status CopyStream(ChunkSource& stream, const FileHandle& output) {
  while (true) {
    std::optional<Chunk> chunk;
    ASSIGN_OR_RETURN(chunk, stream.Next(), "Failed to read input");
    if (!chunk.has_value()) {
      break;
    }
    RETURN_IF_ERROR(output.Write(chunk->data(), chunk->size()),
                    "Failed to write output");
  }
  return output.Flush();
}

isyntax::DeidentifyOptions MakeDeidentifyOptions(
    const DeidentifyFileOptions& options,
    isyntax::ChunkOutputMode chunk_output_mode) {
  isyntax::DeidentifyOptions deid_options;
  deid_options.chunk_output_mode = chunk_output_mode;
  deid_options.keep_original_header = options.original_header_path.has_value();
  return deid_options;
}

}  // namespace

absl::Status DeidentifyFile(const fs::path& input, const fs::path& output,
                            const DeidentifyFileOptions& options) {
  FileHandle input_file;
  ASSIGN_OR_RETURN_MOVE(input_file, FileHandle::Open(input, "rb"));

  isyntax::DeidentifyResult result;
  ASSIGN_OR_RETURN_MOVE(
      result,
      isyntax::Deidentify(
          std::make_unique<FileChunkSource>(input_file, options.chunk_size),
          MakeDeidentifyOptions(options, isyntax::ChunkOutputMode::kRechunk)),
      input.string());

  // Claim the output before writing the header backup.
  FileHandle output_file;
  ASSIGN_OR_RETURN_MOVE(output_file, FileHandle::Open(output, "wbx"));

  bool header_saved = false;
  absl::Status status = SaveOriginalHeader(result, options);
  if (status.ok()) {
    header_saved = options.original_header_path.has_value();
    status = CopyStream(*result.stream, output_file);
  }
  if (!status.ok()) {
    // Do not leave a truncated slide or an orphaned header behind.
    output_file = FileHandle();
    std::error_code ec;
    fs::remove(output, ec);
    if (header_saved) {
      fs::remove(*options.original_header_path, ec);
    }
    return ::slidedeid::status::AddTrace(status, __func__, __FILE__, __LINE__,
                                         output.string());
  }

  LOG(INFO) << "Wrote deidentified slide " << output.string() << " ("
            << result.header_size << " byte header rewritten)";
  return absl::OkStatus();
}

absl::Status DeidentifyFileInPlace(const fs::path& input,
                                   const DeidentifyFileOptions& options) {
  FileHandle file;
  ASSIGN_OR_RETURN_MOVE(file, FileHandle::Open(input, "r+b"));

  isyntax::DeidentifyResult result;
  ASSIGN_OR_RETURN_MOVE(
      result,
      isyntax::Deidentify(
          std::make_unique<FileChunkSource>(file, options.chunk_size),
          MakeDeidentifyOptions(options,
                                isyntax::ChunkOutputMode::kSingleChunk)),
      input.string());
  RETURN_IF_ERROR(SaveOriginalHeader(result, options), "");

  std::optional<Chunk> prefix;
  ASSIGN_OR_RETURN(prefix, result.stream->Next());
  if (!prefix.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Deidentified stream produced no header");
  }

  RETURN_IF_ERROR(file.Seek(0), input.string());
  RETURN_IF_ERROR(file.Write(prefix->data(), prefix->size()), input.string());
  RETURN_IF_ERROR(file.Flush(), input.string());

  LOG(INFO) << "Deidentified " << input.string() << " in place ("
            << result.header_size << " byte header rewritten)";
  return absl::OkStatus();
}

absl::StatusOr<isyntax::HeaderSummary> InspectFile(const fs::path& path,
                                                   size_t chunk_size) {
  FileHandle file;
  ASSIGN_OR_RETURN_MOVE(file, FileHandle::Open(path, "rb"));

  FileChunkSource source(file, chunk_size);
  std::vector<uint8_t> buffer;
  isyntax::HeaderLocation location;
  ASSIGN_OR_RETURN(location, isyntax::FindHeader(source, buffer),
                   path.string());

  isyntax::HeaderSummary summary;
  ASSIGN_OR_RETURN(
      summary,
      isyntax::InspectHeader(
          std::span<const uint8_t>(buffer.data(), location.header_size)),
      path.string());
  return summary;
}

}  // namespace slidedeid
