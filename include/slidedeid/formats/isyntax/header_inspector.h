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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_INSPECTOR_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_INSPECTOR_H_

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace slidedeid {
namespace isyntax {

/// @brief Identifying fields present in an iSyntax header
struct HeaderSummary {
  std::vector<std::string> barcodes;     ///< Text of every barcode attribute
  std::vector<std::string> image_types;  ///< Type of every scanned image

  /// @brief True if no barcode has a value and no label image is listed
  bool IsDeidentified() const;

  /// @brief True if any image is typed LABELIMAGE
  bool HasLabelImage() const;
};

/// @brief Summarize the identifying fields of a header without modifying it
///
/// Unlike the transform this does not require exactly one of each element;
/// it reports whatever is present.
///
/// @param header Raw header bytes
/// @return Summary of the header
/// @retval FormatError if the header does not parse or has the wrong root
absl::StatusOr<HeaderSummary> InspectHeader(std::span<const uint8_t> header);

}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_INSPECTOR_H_
