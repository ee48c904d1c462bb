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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_ISYNTAX_CONSTANTS_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_ISYNTAX_CONSTANTS_H_

#include <cstddef>
#include <cstdint>
#include <string_view>

/// @file isyntax_constants.h
/// @brief Constants of the iSyntax XML header
///
/// An iSyntax file starts with a UTF-8 XML document describing the slide
/// (a DPUfsImport data object), followed by CR LF and an EOT byte. Binary
/// data follows directly after the EOT and is addressed by absolute offsets,
/// so the header region can never change length.

namespace slidedeid {
namespace isyntax {
namespace constants {

/// @brief Byte ending the header region (ASCII EOT)
constexpr uint8_t kHeaderTerminator = 0x04;

/// @brief Bytes that must precede the terminator
constexpr std::string_view kTerminatorPrefix = "\r\n";

/// @brief Last byte of the XML text (end of the closing root tag)
constexpr uint8_t kTagClose = '>';

/// @brief Byte used to pad a shrunk header back to its original length
constexpr uint8_t kPaddingByte = '\n';

/// @brief Declaration written in front of every serialized header
constexpr std::string_view kXmlDeclaration =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

// Element and attribute names of the PMS data object model.
constexpr const char* kDataObjectTag = "DataObject";
constexpr const char* kAttributeTag = "Attribute";
constexpr const char* kArrayTag = "Array";
constexpr const char* kObjectTypeAttr = "ObjectType";
constexpr const char* kNameAttr = "Name";
constexpr const char* kGroupAttr = "Group";
constexpr const char* kElementAttr = "Element";
constexpr const char* kPmsvrAttr = "PMSVR";

/// @brief ObjectType of the root data object
constexpr std::string_view kRootObjectType = "DPUfsImport";

/// @brief ObjectType of an entry of the scanned images array
constexpr std::string_view kScannedImageObjectType = "DPScannedImage";

/// @brief DICOM-style group of all PIM_DP attributes
///
/// Producers write the hex digits in either case; both spellings are
/// accepted, the "0x" prefix is always lowercase.
constexpr std::string_view kPimDpGroupUpper = "0x301D";
constexpr std::string_view kPimDpGroupLower = "0x301d";

/// @brief Attribute holding the specimen barcode
constexpr std::string_view kBarcodeName = "PIM_DP_UFS_BARCODE";
constexpr std::string_view kBarcodeElement = "0x1002";

/// @brief Attribute holding the array of scanned images
constexpr std::string_view kScannedImagesName = "PIM_DP_SCANNED_IMAGES";
constexpr std::string_view kScannedImagesElement = "0x1003";

/// @brief Attribute holding the type of one scanned image
constexpr std::string_view kImageTypeName = "PIM_DP_IMAGE_TYPE";
constexpr std::string_view kImageTypeElement = "0x1004";

/// @brief Image type of the slide label photograph
constexpr std::string_view kLabelImageType = "LABELIMAGE";

// PMSVR value kinds.
constexpr std::string_view kStringKind = "IString";
constexpr std::string_view kDataObjectArrayKind = "IDataObjectArray";

}  // namespace constants
}  // namespace isyntax
}  // namespace slidedeid

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_FORMATS_ISYNTAX_ISYNTAX_CONSTANTS_H_
