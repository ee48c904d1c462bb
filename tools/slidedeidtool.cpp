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

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "slidedeid/slidedeid.h"

namespace fs = std::filesystem;

namespace {

struct ToolOptions {
  std::string input_img;
  std::string output_img;
  bool inplace = false;
  size_t chunk_size = slidedeid::kDefaultChunkSize;
  std::string original_header;
  bool verify = false;
};

absl::Status VerifyDeidentified(const fs::path& path, size_t chunk_size) {
  auto summary_or = slidedeid::InspectFile(path, chunk_size);
  if (!summary_or.ok()) {
    return summary_or.status();
  }
  const auto& summary = *summary_or;

  bool deidentified = true;
  for (const auto& barcode : summary.barcodes) {
    if (!barcode.empty()) {
      LOG(WARNING) << path.string() << ": barcode still present";
      deidentified = false;
    }
  }
  if (summary.HasLabelImage()) {
    LOG(WARNING) << path.string() << ": label image still present";
    deidentified = false;
  }
  if (!deidentified) {
    return absl::DataLossError(path.string() + " is not deidentified");
  }
  std::cout << "Slide is deidentified: " << path.string() << '\n';
  return absl::OkStatus();
}

int Run(const ToolOptions& tool_options) {
  slidedeid::DeidentifyFileOptions options;
  options.chunk_size = tool_options.chunk_size;
  if (!tool_options.original_header.empty()) {
    options.original_header_path = fs::path(tool_options.original_header);
  }

  const fs::path input(tool_options.input_img);
  const fs::path written =
      tool_options.inplace ? input : fs::path(tool_options.output_img);

  absl::Status status =
      tool_options.inplace
          ? slidedeid::DeidentifyFileInPlace(input, options)
          : slidedeid::DeidentifyFile(input, written, options);
  if (!status.ok()) {
    LOG(ERROR) << "Deidentification failed ("
               << slidedeid::GetName(slidedeid::GetDeidErrorKind(status))
               << ")";
    std::cerr << "Error: Failed to deidentify " << input.string() << '\n';
    std::cerr << "Status: " << status << '\n';
    return 1;
  }

  if (tool_options.verify) {
    status = VerifyDeidentified(written, tool_options.chunk_size);
    if (!status.ok()) {
      std::cerr << "Error: Verification failed\n";
      std::cerr << "Status: " << status << '\n';
      return 1;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  absl::InitializeLog();

  CLI::App app{"Deidentify iSyntax whole-slide images"};
  ToolOptions tool_options;

  app.add_option("input_img", tool_options.input_img, "Input image path")
      ->required()
      ->check(CLI::ExistingFile);

  auto* mode = app.add_option_group("mode", "Where to write the result");
  mode->add_option("-o,--output-img", tool_options.output_img,
                   "Output image path (must not exist)");
  mode->add_flag("-i,--inplace", tool_options.inplace,
                 "Deidentify the image in-place");
  mode->require_option(1);

  app.add_option("--chunk-size", tool_options.chunk_size,
                 "Read size in bytes")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  app.add_option("--save-original-header", tool_options.original_header,
                 "Write the untouched header to this path (must not exist)");
  app.add_flag("--verify", tool_options.verify,
               "Re-read the result and check that it is deidentified");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return Run(tool_options);
}
