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


#include "slidedeid/deidentify_file.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "absl/status/status.h"
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/testing/header_builder.h"

namespace fs = std::filesystem;

namespace slidedeid {

namespace testing_util = isyntax::testing;

/// @brief Test fixture with a scratch directory holding a synthetic slide
class DeidentifyFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = fs::temp_directory_path() /
                ("deidentify_file_test_" +
                 std::string(::testing::UnitTest::GetInstance()
                                 ->current_test_info()
                                 ->name()));
    fs::remove_all(temp_dir_);
    fs::create_directories(temp_dir_);

    header_ = testing_util::SampleHeader("PATIENT-7");
    slide_ = testing_util::MakeSlide(header_, testing_util::Payload(20000));
    input_path_ = temp_dir_ / "slide.isyntax";
    WriteFile(input_path_, slide_);
  }

  void TearDown() override {
    if (fs::exists(temp_dir_)) {
      fs::remove_all(temp_dir_);
    }
  }

  static void WriteFile(const fs::path& path,
                        const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  }

  static std::vector<uint8_t> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
  }

  fs::path temp_dir_;
  fs::path input_path_;
  std::string header_;
  std::vector<uint8_t> slide_;
};

TEST_F(DeidentifyFileTest, WritesDeidentifiedCopy) {
  const fs::path output = temp_dir_ / "deid.isyntax";
  DeidentifyFileOptions options;
  options.chunk_size = 512;
  absl::Status status = DeidentifyFile(input_path_, output, options);
  ASSERT_TRUE(status.ok()) << status;

  const auto written = ReadFile(output);
  ASSERT_EQ(written.size(), slide_.size());
  EXPECT_TRUE(std::equal(written.begin() + header_.size(), written.end(),
                         slide_.begin() + header_.size()));
  EXPECT_EQ(ReadFile(input_path_), slide_);

  auto summary = InspectFile(output, 512);
  ASSERT_TRUE(summary.ok()) << summary.status();
  EXPECT_TRUE(summary->IsDeidentified());

  auto original = InspectFile(input_path_);
  ASSERT_TRUE(original.ok()) << original.status();
  EXPECT_FALSE(original->IsDeidentified());
  EXPECT_EQ(original->barcodes, (std::vector<std::string>{"PATIENT-7"}));
}

TEST_F(DeidentifyFileTest, ExistingOutputIsNotTouched) {
  const fs::path output = temp_dir_ / "exists.isyntax";
  const std::vector<uint8_t> existing = {'k', 'e', 'e', 'p'};
  WriteFile(output, existing);

  absl::Status status = DeidentifyFile(input_path_, output);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kAlreadyExists);
  EXPECT_EQ(ReadFile(output), existing);
}

TEST_F(DeidentifyFileTest, ExistingOutputLeavesNoHeaderBackup) {
  const fs::path output = temp_dir_ / "exists.isyntax";
  const std::vector<uint8_t> existing = {'k', 'e', 'e', 'p'};
  WriteFile(output, existing);
  const fs::path header_path = temp_dir_ / "header.xml";
  DeidentifyFileOptions options;
  options.original_header_path = header_path;

  absl::Status status = DeidentifyFile(input_path_, output, options);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kAlreadyExists);
  EXPECT_FALSE(fs::exists(header_path));
  EXPECT_EQ(ReadFile(output), existing);
}

TEST_F(DeidentifyFileTest, ExistingHeaderBackupRemovesNewOutput) {
  const fs::path output = temp_dir_ / "deid.isyntax";
  const fs::path header_path = temp_dir_ / "header.xml";
  WriteFile(header_path, {'x'});
  DeidentifyFileOptions options;
  options.original_header_path = header_path;

  absl::Status status = DeidentifyFile(input_path_, output, options);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kAlreadyExists);
  EXPECT_FALSE(fs::exists(output));
  EXPECT_EQ(ReadFile(header_path), (std::vector<uint8_t>{'x'}));
}

TEST_F(DeidentifyFileTest, CopySavesOriginalHeader) {
  const fs::path output = temp_dir_ / "deid.isyntax";
  const fs::path header_path = temp_dir_ / "header.xml";
  DeidentifyFileOptions options;
  options.original_header_path = header_path;
  ASSERT_TRUE(DeidentifyFile(input_path_, output, options).ok());

  const auto saved = ReadFile(header_path);
  EXPECT_EQ(std::string(saved.begin(), saved.end()), header_);
  EXPECT_EQ(ReadFile(input_path_), slide_);
}

TEST_F(DeidentifyFileTest, InvalidInputCreatesNoOutput) {
  const fs::path invalid = temp_dir_ / "invalid.isyntax";
  WriteFile(invalid,
            testing_util::MakeSlide(testing_util::Document(testing_util::Images(
                                        {testing_util::Image("LABELIMAGE")})),
                                    "payload"));
  const fs::path output = temp_dir_ / "never.isyntax";

  absl::Status status = DeidentifyFile(invalid, output);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(GetDeidErrorKind(status), DeidErrorKind::kBarcode);
  EXPECT_FALSE(fs::exists(output));
}

TEST_F(DeidentifyFileTest, MissingInput) {
  absl::Status status =
      DeidentifyFile(temp_dir_ / "missing.isyntax", temp_dir_ / "out.isyntax");
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
  EXPECT_FALSE(fs::exists(temp_dir_ / "out.isyntax"));
}

TEST_F(DeidentifyFileTest, InPlaceRewritesOnlyThePrefix) {
  DeidentifyFileOptions options;
  options.chunk_size = 256;
  absl::Status status = DeidentifyFileInPlace(input_path_, options);
  ASSERT_TRUE(status.ok()) << status;

  const auto rewritten = ReadFile(input_path_);
  ASSERT_EQ(rewritten.size(), slide_.size());
  EXPECT_TRUE(std::equal(rewritten.begin() + header_.size(), rewritten.end(),
                         slide_.begin() + header_.size()));
  EXPECT_FALSE(std::equal(rewritten.begin(),
                          rewritten.begin() + header_.size(), slide_.begin()));

  auto summary = InspectFile(input_path_);
  ASSERT_TRUE(summary.ok()) << summary.status();
  EXPECT_TRUE(summary->IsDeidentified());
}

TEST_F(DeidentifyFileTest, InPlaceMatchesCopy) {
  const fs::path output = temp_dir_ / "copy.isyntax";
  ASSERT_TRUE(DeidentifyFile(input_path_, output).ok());
  ASSERT_TRUE(DeidentifyFileInPlace(input_path_).ok());
  EXPECT_EQ(ReadFile(input_path_), ReadFile(output));
}

TEST_F(DeidentifyFileTest, InPlaceFailureLeavesFileUnchanged) {
  const auto invalid = testing_util::MakeSlide(
      testing_util::Document(testing_util::Barcode("A") +
                             testing_util::Images({testing_util::Image("WSI")})),
      "payload");
  WriteFile(input_path_, invalid);

  absl::Status status = DeidentifyFileInPlace(input_path_);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(GetDeidErrorKind(status), DeidErrorKind::kLabel);
  EXPECT_EQ(ReadFile(input_path_), invalid);
}

TEST_F(DeidentifyFileTest, SavesOriginalHeader) {
  const fs::path header_path = temp_dir_ / "header.xml";
  DeidentifyFileOptions options;
  options.original_header_path = header_path;
  ASSERT_TRUE(DeidentifyFileInPlace(input_path_, options).ok());

  const auto saved = ReadFile(header_path);
  EXPECT_EQ(std::string(saved.begin(), saved.end()), header_);
}

TEST_F(DeidentifyFileTest, ExistingOriginalHeaderPathFails) {
  const fs::path header_path = temp_dir_ / "header.xml";
  WriteFile(header_path, {'x'});
  DeidentifyFileOptions options;
  options.original_header_path = header_path;

  absl::Status status = DeidentifyFileInPlace(input_path_, options);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kAlreadyExists);
  EXPECT_EQ(ReadFile(input_path_), slide_);
}

}  // namespace slidedeid
