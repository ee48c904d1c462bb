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

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/testing/header_builder.h"

namespace slidedeid {
namespace isyntax {
namespace {

using testing::Barcode;
using testing::Document;
using testing::Image;
using testing::Images;
using testing::ToBytes;

TEST(HeaderInspectorTest, ReportsBarcodeAndImageTypes) {
  auto summary = InspectHeader(ToBytes(testing::SampleHeader("ABC123")));
  ASSERT_TRUE(summary.ok()) << summary.status();
  EXPECT_EQ(summary->barcodes, (std::vector<std::string>{"ABC123"}));
  EXPECT_EQ(summary->image_types,
            (std::vector<std::string>{"WSI", "LABELIMAGE"}));
  EXPECT_TRUE(summary->HasLabelImage());
  EXPECT_FALSE(summary->IsDeidentified());
}

TEST(HeaderInspectorTest, ToleratesMissingAndRepeatedFields) {
  // Inspection reports what is there instead of enforcing single matches.
  auto summary = InspectHeader(ToBytes(Document(Barcode("") + Barcode("") +
                                                Images({Image("WSI")}) +
                                                Images({Image("MACROIMAGE")}))));
  ASSERT_TRUE(summary.ok()) << summary.status();
  EXPECT_EQ(summary->barcodes, (std::vector<std::string>{"", ""}));
  EXPECT_EQ(summary->image_types,
            (std::vector<std::string>{"WSI", "MACROIMAGE"}));
  EXPECT_TRUE(summary->IsDeidentified());

  auto empty = InspectHeader(ToBytes(Document("")));
  ASSERT_TRUE(empty.ok()) << empty.status();
  EXPECT_TRUE(empty->barcodes.empty());
  EXPECT_TRUE(empty->image_types.empty());
  EXPECT_TRUE(empty->IsDeidentified());
}

TEST(HeaderInspectorTest, BarcodeOnlyIsNotDeidentified) {
  auto summary = InspectHeader(
      ToBytes(Document(Barcode("XYZ") + Images({Image("WSI")}))));
  ASSERT_TRUE(summary.ok()) << summary.status();
  EXPECT_FALSE(summary->HasLabelImage());
  EXPECT_FALSE(summary->IsDeidentified());
}

TEST(HeaderInspectorTest, RejectsInvalidHeaders) {
  auto summary = InspectHeader(ToBytes("<DataObject ObjectType=\"Other\"/>"));
  ASSERT_FALSE(summary.ok());
  EXPECT_EQ(GetDeidErrorKind(summary.status()), DeidErrorKind::kFormat);
  EXPECT_EQ(summary.status().message(), "Invalid header root element");
}

}  // namespace
}  // namespace isyntax
}  // namespace slidedeid
