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

#include "slidedeid/formats/isyntax/header_schema.h"

#include <string>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/isyntax_constants.h"

namespace slidedeid {
namespace isyntax {
namespace internal {

namespace {

bool AttributeEquals(const pugi::xml_node& node, const char* name,
                     std::string_view expected) {
  pugi::xml_attribute attribute = node.attribute(name);
  return attribute && std::string_view(attribute.value()) == expected;
}

bool IsScannedImage(const pugi::xml_node& node) {
  return std::string_view(node.name()) == constants::kDataObjectTag &&
         AttributeEquals(node, constants::kObjectTypeAttr,
                         constants::kScannedImageObjectType);
}

bool IsImageTypeAttribute(const pugi::xml_node& node) {
  return IsPimDpAttribute(node, constants::kImageTypeName,
                          constants::kImageTypeElement, constants::kStringKind);
}

bool IsWhitespace(std::string_view text) {
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

void AppendText(const pugi::xml_node& node, std::string& out) {
  for (pugi::xml_node child = node.first_child(); child;
       child = child.next_sibling()) {
    switch (child.type()) {
      case pugi::node_pcdata:
      case pugi::node_cdata:
        out.append(child.value());
        break;
      case pugi::node_element:
        AppendText(child, out);
        break;
      default:
        break;
    }
  }
}

}  // namespace

absl::StatusOr<pugi::xml_node> ParseHeaderDocument(
    std::span<const uint8_t> header, pugi::xml_document& doc) {
  pugi::xml_parse_result result = doc.load_buffer(
      header.data(), header.size(), kHeaderParseOptions, pugi::encoding_utf8);
  if (!result) {
    return FormatError("Error decoding header");
  }

  // Exactly one element at document level; comments and whitespace around it
  // are allowed.
  pugi::xml_node root;
  for (pugi::xml_node child = doc.first_child(); child;
       child = child.next_sibling()) {
    switch (child.type()) {
      case pugi::node_element:
        if (root) {
          return FormatError("Error decoding header");
        }
        root = child;
        break;
      case pugi::node_pcdata:
      case pugi::node_cdata:
        if (!IsWhitespace(child.value())) {
          return FormatError("Error decoding header");
        }
        break;
      default:
        break;
    }
  }
  if (!root) {
    return FormatError("Error decoding header");
  }

  if (std::string_view(root.name()) != constants::kDataObjectTag ||
      !AttributeEquals(root, constants::kObjectTypeAttr,
                       constants::kRootObjectType)) {
    return FormatError("Invalid header root element");
  }
  return root;
}

bool IsPimDpGroup(std::string_view group) {
  return group == constants::kPimDpGroupUpper ||
         group == constants::kPimDpGroupLower;
}

bool IsPimDpAttribute(const pugi::xml_node& node, std::string_view name,
                      std::string_view element, std::string_view kind) {
  return std::string_view(node.name()) == constants::kAttributeTag &&
         AttributeEquals(node, constants::kNameAttr, name) &&
         node.attribute(constants::kGroupAttr) &&
         IsPimDpGroup(node.attribute(constants::kGroupAttr).value()) &&
         AttributeEquals(node, constants::kElementAttr, element) &&
         AttributeEquals(node, constants::kPmsvrAttr, kind);
}

std::string StringValue(const pugi::xml_node& node) {
  std::string value;
  AppendText(node, value);
  return value;
}

std::vector<pugi::xml_node> FindBarcodes(const pugi::xml_node& root) {
  return FindChildren(root, [](const pugi::xml_node& node) {
    return IsPimDpAttribute(node, constants::kBarcodeName,
                            constants::kBarcodeElement, constants::kStringKind);
  });
}

std::vector<pugi::xml_node> FindImageArrays(const pugi::xml_node& root) {
  std::vector<pugi::xml_node> arrays;
  auto attributes = FindChildren(root, [](const pugi::xml_node& node) {
    return IsPimDpAttribute(node, constants::kScannedImagesName,
                            constants::kScannedImagesElement,
                            constants::kDataObjectArrayKind);
  });
  for (const auto& attribute : attributes) {
    auto children = FindChildren(attribute, [](const pugi::xml_node& node) {
      return std::string_view(node.name()) == constants::kArrayTag;
    });
    arrays.insert(arrays.end(), children.begin(), children.end());
  }
  return arrays;
}

std::vector<pugi::xml_node> FindImageEntries(
    const pugi::xml_node& images_array) {
  return FindChildren(images_array, IsScannedImage);
}

std::vector<pugi::xml_node> FindLabelEntries(
    const pugi::xml_node& images_array) {
  return FindChildren(images_array, [](const pugi::xml_node& node) {
    if (!IsScannedImage(node)) {
      return false;
    }
    auto labels = FindChildren(node, [](const pugi::xml_node& attribute) {
      return IsImageTypeAttribute(attribute) &&
             StringValue(attribute) == constants::kLabelImageType;
    });
    return !labels.empty();
  });
}

std::vector<std::string> GetImageTypes(const pugi::xml_node& image_entry) {
  std::vector<std::string> types;
  for (const auto& attribute : FindChildren(image_entry, IsImageTypeAttribute)) {
    types.push_back(StringValue(attribute));
  }
  return types;
}

absl::StatusOr<pugi::xml_node> FindSingleMatch(
    const std::vector<pugi::xml_node>& matches, const SingleMatchError& error) {
  if (matches.empty()) {
    return MakeDeidError(error.kind, absl::StatusCode::kNotFound,
                         error.not_found);
  }
  if (matches.size() > 1) {
    return MakeDeidError(error.kind, absl::StatusCode::kFailedPrecondition,
                         absl::StrFormat("Single %s expected, %d found",
                                         error.element_noun, matches.size()));
  }
  return matches.front();
}

}  // namespace internal
}  // namespace isyntax
}  // namespace slidedeid
