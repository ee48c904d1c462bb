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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCHEMA_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCHEMA_H_

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "absl/status/statusor.h"
#include "slidedeid/errors.h"

/// @file header_schema.h
/// @brief Element queries shared by the header transform and inspector
///
/// The queries mirror the XPath expressions of the PMS data model:
///   barcode: ./Attribute[@Name='PIM_DP_UFS_BARCODE'][@Group][@Element='0x1002'][@PMSVR='IString']
///   images:  ./Attribute[@Name='PIM_DP_SCANNED_IMAGES'][...][@PMSVR='IDataObjectArray']/Array
///   label:   ./DataObject[@ObjectType='DPScannedImage']/Attribute[@Name='PIM_DP_IMAGE_TYPE'][...][.='LABELIMAGE']/..
/// All of them are evaluated relative to a context node and only look at
/// direct children.

namespace slidedeid {
namespace isyntax {
namespace internal {

/// @brief Parse options used for every header document
///
/// Whitespace-only text and comments are kept so re-serialization stays
/// close to the original bytes. Fragment mode keeps text outside the root
/// element in the tree, where ParseHeaderDocument rejects it.
inline constexpr unsigned int kHeaderParseOptions =
    pugi::parse_default | pugi::parse_ws_pcdata | pugi::parse_comments |
    pugi::parse_fragment;

/// @brief Parse a header and validate its root element
/// @param header Raw header bytes (XML text, optional trailing padding)
/// @param doc Document that receives the tree; owns the returned node
/// @return The DPUfsImport root data object
/// @retval FormatError "Error decoding header" if the XML does not parse, or
///         the document is not a single element (non-whitespace text or
///         further elements around it)
/// @retval FormatError "Invalid header root element" on a root mismatch
absl::StatusOr<pugi::xml_node> ParseHeaderDocument(
    std::span<const uint8_t> header, pugi::xml_document& doc);

/// @brief Whether @p group spells the PIM_DP group (0x301D, either case)
bool IsPimDpGroup(std::string_view group);

/// @brief Whether @p node is an Attribute element with the given identity
/// @param node Candidate element
/// @param name Expected Name attribute
/// @param element Expected Element attribute (exact)
/// @param kind Expected PMSVR attribute (exact)
bool IsPimDpAttribute(const pugi::xml_node& node, std::string_view name,
                      std::string_view element, std::string_view kind);

/// @brief XPath string-value: concatenated text of all descendants
std::string StringValue(const pugi::xml_node& node);

/// @brief Children of @p parent accepted by @p predicate, in document order
template <typename Predicate>
std::vector<pugi::xml_node> FindChildren(const pugi::xml_node& parent,
                                         Predicate&& predicate) {
  std::vector<pugi::xml_node> matches;
  for (pugi::xml_node child = parent.first_child(); child;
       child = child.next_sibling()) {
    if (child.type() == pugi::node_element && predicate(child)) {
      matches.push_back(child);
    }
  }
  return matches;
}

/// @brief Barcode attributes directly under @p root
std::vector<pugi::xml_node> FindBarcodes(const pugi::xml_node& root);

/// @brief Array elements of the scanned-images attributes under @p root
std::vector<pugi::xml_node> FindImageArrays(const pugi::xml_node& root);

/// @brief Scanned image entries of @p images_array
std::vector<pugi::xml_node> FindImageEntries(const pugi::xml_node& images_array);

/// @brief Image entries of @p images_array typed LABELIMAGE
///
/// An entry is counted once even if it carries several matching type
/// attributes.
std::vector<pugi::xml_node> FindLabelEntries(const pugi::xml_node& images_array);

/// @brief Values of the image type attributes of one image entry
std::vector<std::string> GetImageTypes(const pugi::xml_node& image_entry);

/// @brief How to report a failed "exactly one" query
struct SingleMatchError {
  DeidErrorKind kind;             ///< Error kind to tag the status with
  std::string_view not_found;     ///< Message when nothing matched
  std::string_view element_noun;  ///< Used in "Single %s expected, %d found"
};

/// @brief Require exactly one match
/// @param matches Result of a query
/// @param error Error description used when the count is not one
/// @return The single match
/// @retval kNotFound with @p error's kind when @p matches is empty
/// @retval kFailedPrecondition with @p error's kind, reporting the count,
///         when there is more than one match
absl::StatusOr<pugi::xml_node> FindSingleMatch(
    const std::vector<pugi::xml_node>& matches, const SingleMatchError& error);

}  // namespace internal
}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_HEADER_SCHEMA_H_
