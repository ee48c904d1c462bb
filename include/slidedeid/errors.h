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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_ERRORS_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_ERRORS_H_

#include <string_view>

#include "absl/status/status.h"

/**
 * @file errors.h
 * @brief Error taxonomy for header deidentification
 *
 * Every deidentification failure is an absl::Status tagged with a
 * DeidErrorKind payload. The payload survives trace propagation through the
 * status macros, so callers can always tell a malformed container from a
 * header that lacks (or duplicates) one of the identifying elements.
 */

namespace slidedeid {

/// @brief Kind of a deidentification failure
enum class DeidErrorKind {
  kNone,     ///< Not a deidentification error (ok, or e.g. an I/O failure)
  kFormat,   ///< Header region or document is malformed, or does not fit
  kBarcode,  ///< Zero or several barcode attributes
  kImages,   ///< Zero or several scanned image arrays
  kLabel,    ///< Zero or several label image entries
};

/// @brief Status payload type URL carrying the DeidErrorKind
inline constexpr std::string_view kDeidErrorKindUrl =
    "type.slidedeid/slidedeid.DeidErrorKind";

/// @brief Malformed header region or metadata document
/// @param message Error message, surfaced verbatim
/// @return kInvalidArgument status tagged with DeidErrorKind::kFormat
absl::Status FormatError(std::string_view message);

/// @brief Barcode attribute missing (kNotFound) or duplicated
/// (kFailedPrecondition)
absl::Status BarcodeError(absl::StatusCode code, std::string_view message);

/// @brief Scanned images array missing or duplicated
absl::Status ImagesError(absl::StatusCode code, std::string_view message);

/// @brief Label image entry missing or duplicated
absl::Status LabelError(absl::StatusCode code, std::string_view message);

/// @brief Build a tagged status for an arbitrary kind
/// @param kind Error kind; kNone yields an untagged status
/// @param code Status code
/// @param message Error message
absl::Status MakeDeidError(DeidErrorKind kind, absl::StatusCode code,
                           std::string_view message);

/// @brief Extract the error kind of a status
/// @return kNone for ok statuses and statuses without a kind payload
DeidErrorKind GetDeidErrorKind(const absl::Status& status);

/// @brief Human readable name of an error kind ("FormatError", ...)
std::string_view GetName(DeidErrorKind kind);

}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_ERRORS_H_
