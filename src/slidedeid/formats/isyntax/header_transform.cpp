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

#include "slidedeid/formats/isyntax/header_transform.h"

#include <algorithm>
#include <vector>

#include <pugixml.hpp>

#include "absl/log/log.h"
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/header_schema.h"
#include "slidedeid/formats/isyntax/isyntax_constants.h"

namespace slidedeid {
namespace isyntax {

namespace {

using internal::FindSingleMatch;
using internal::SingleMatchError;

constexpr SingleMatchError kBarcodeMatch{DeidErrorKind::kBarcode,
                                         "Barcode not found",
                                         "barcode element"};
constexpr SingleMatchError kImagesMatch{DeidErrorKind::kImages,
                                        "Images not found", "images element"};
constexpr SingleMatchError kLabelMatch{DeidErrorKind::kLabel,
                                       "Label not found", "label"};

/// @brief pugixml writer appending to a byte vector
class ByteWriter : public pugi::xml_writer {
 public:
  explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

  void write(const void* data, size_t size) override {
    const auto* bytes = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), bytes, bytes + size);
  }

 private:
  std::vector<uint8_t>& out_;
};

void ClearText(pugi::xml_node& node) {
  pugi::xml_node child = node.first_child();
  while (child) {
    pugi::xml_node next = child.next_sibling();
    if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
      node.remove_child(child);
    }
    child = next;
  }
}

}  // namespace

absl::StatusOr<std::vector<uint8_t>> DeidentifyHeader(
    std::span<const uint8_t> header) {
  pugi::xml_document doc;
  auto root = internal::ParseHeaderDocument(header, doc);
  if (!root.ok()) {
    return root.status();
  }

  auto barcode = FindSingleMatch(internal::FindBarcodes(*root), kBarcodeMatch);
  if (!barcode.ok()) {
    return barcode.status();
  }
  ClearText(*barcode);

  auto images =
      FindSingleMatch(internal::FindImageArrays(*root), kImagesMatch);
  if (!images.ok()) {
    return images.status();
  }

  auto label =
      FindSingleMatch(internal::FindLabelEntries(*images), kLabelMatch);
  if (!label.ok()) {
    return label.status();
  }
  images->remove_child(*label);

  std::vector<uint8_t> deidentified(constants::kXmlDeclaration.begin(),
                                    constants::kXmlDeclaration.end());
  ByteWriter writer(deidentified);
  root->print(writer, "", pugi::format_raw, pugi::encoding_utf8);

  if (deidentified.size() > header.size()) {
    return FormatError(
        "Deidentified header size must be lower than or equal to the "
        "original header size");
  }

  const size_t padding = header.size() - deidentified.size();
  VLOG(1) << "Deidentified header: " << deidentified.size()
          << " bytes of XML, " << padding << " bytes of padding";
  deidentified.resize(header.size(), constants::kPaddingByte);
  return deidentified;
}

absl::Status DeidentifyHeaderInPlace(std::span<uint8_t> header) {
  auto deidentified = DeidentifyHeader(header);
  if (!deidentified.ok()) {
    return deidentified.status();
  }
  std::copy(deidentified->begin(), deidentified->end(), header.begin());
  return absl::OkStatus();
}

}  // namespace isyntax
}  // namespace slidedeid
