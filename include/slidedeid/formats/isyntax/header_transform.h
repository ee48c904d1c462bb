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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_TRANSFORM_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_TRANSFORM_H_

#include <cstdint>
#include <span>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace slidedeid {
namespace isyntax {

/// @brief Deidentify an iSyntax XML header
///
/// Parses the header, clears the text of the PIM_DP_UFS_BARCODE attribute
/// (the element itself is kept) and removes the scanned image entry typed
/// LABELIMAGE. The document is re-serialized behind a fixed UTF-8 XML
/// declaration and padded with '\n' to exactly `header.size()` bytes.
///
/// @param header Raw header bytes, from offset 0 up to and including the
///        last '>' before the terminator
/// @return Deidentified header of the same length
/// @retval FormatError on parse failure, root mismatch, or when the
///         deidentified document does not fit in `header.size()` bytes
/// @retval BarcodeError unless exactly one barcode attribute exists
/// @retval ImagesError unless exactly one scanned images array exists
/// @retval LabelError unless exactly one label image entry exists
absl::StatusOr<std::vector<uint8_t>> DeidentifyHeader(
    std::span<const uint8_t> header);

/// @brief Deidentify a header region in place
///
/// Same transform as DeidentifyHeader(). @p header is only overwritten when
/// the transform succeeds.
absl::Status DeidentifyHeaderInPlace(std::span<uint8_t> header);

}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_TRANSFORM_H_
