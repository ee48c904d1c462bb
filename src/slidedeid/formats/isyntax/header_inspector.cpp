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

#include "slidedeid/formats/isyntax/header_inspector.h"

#include <algorithm>

#include <pugixml.hpp>

#include "slidedeid/formats/isyntax/header_schema.h"
#include "slidedeid/formats/isyntax/isyntax_constants.h"

namespace slidedeid {
namespace isyntax {

bool HeaderSummary::IsDeidentified() const {
  const bool has_barcode =
      std::any_of(barcodes.begin(), barcodes.end(),
                  [](const std::string& barcode) { return !barcode.empty(); });
  return !has_barcode && !HasLabelImage();
}

bool HeaderSummary::HasLabelImage() const {
  return std::find(image_types.begin(), image_types.end(),
                   constants::kLabelImageType) != image_types.end();
}

absl::StatusOr<HeaderSummary> InspectHeader(std::span<const uint8_t> header) {
  pugi::xml_document doc;
  auto root = internal::ParseHeaderDocument(header, doc);
  if (!root.ok()) {
    return root.status();
  }

  HeaderSummary summary;
  for (const auto& barcode : internal::FindBarcodes(*root)) {
    summary.barcodes.push_back(internal::StringValue(barcode));
  }
  for (const auto& images : internal::FindImageArrays(*root)) {
    for (const auto& entry : internal::FindImageEntries(images)) {
      auto types = internal::GetImageTypes(entry);
      summary.image_types.insert(summary.image_types.end(), types.begin(),
                                 types.end());
    }
  }
  return summary;
}

}  // namespace isyntax
}  // namespace slidedeid
