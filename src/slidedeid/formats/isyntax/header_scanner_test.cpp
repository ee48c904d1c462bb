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


#include "slidedeid/formats/isyntax/header_scanner.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "absl/status/status.h"
#include "slidedeid/errors.h"
#include "slidedeid/formats/isyntax/testing/header_builder.h"
#include "slidedeid/runtime/io/chunk_source.h"

namespace slidedeid {
namespace isyntax {
namespace {

using testing::MakeSlide;
using testing::ToBytes;

class FailingChunkSource : public ChunkSource {
 public:
  absl::StatusOr<std::optional<Chunk>> Next() override {
    return absl::DataLossError("Disk read failed");
  }
};

void ExpectFormatError(const std::vector<uint8_t>& bytes, size_t chunk_size,
                       std::string_view message) {
  auto source = MemoryChunkSource::FromBytes(bytes, chunk_size);
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_FALSE(location.ok());
  EXPECT_EQ(GetDeidErrorKind(location.status()), DeidErrorKind::kFormat);
  EXPECT_EQ(location.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(location.status().message(), message);
}

TEST(HeaderScannerTest, MissingTerminator) {
  ExpectFormatError(ToBytes("<DataObject/>\r\n"), 16, "Header not found");
  ExpectFormatError({}, 16, "Header not found");
}

TEST(HeaderScannerTest, InvalidDelimiters) {
  ExpectFormatError(ToBytes(std::string("<DataObject/>\n\x04", 15)), 16,
                    "Error decoding header");
  ExpectFormatError(ToBytes(std::string("<DataObject/>\r\x04", 15)), 16,
                    "Error decoding header");
  ExpectFormatError(ToBytes(std::string("\x04<DataObject/>", 14)), 16,
                    "Error decoding header");
  ExpectFormatError(ToBytes(std::string("\n\x04", 2)), 16,
                    "Error decoding header");
}

TEST(HeaderScannerTest, NoTagBeforeTerminator) {
  ExpectFormatError(MakeSlide("no markup here", "tail"), 16,
                    "Error decoding header");
}

TEST(HeaderScannerTest, LocatesHeaderAcrossChunks) {
  const std::string header = "<DataObject ObjectType=\"DPUfsImport\"/>";
  const auto slide = MakeSlide(header, std::string(100, 'x'));

  auto source = MemoryChunkSource::FromBytes(slide, 16);
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_TRUE(location.ok()) << location.status();

  EXPECT_EQ(location->header_size, header.size());
  EXPECT_EQ(location->chunk_size, 16u);
  // Whole chunks are buffered, up to and including the one with the 0x04.
  const size_t terminator = header.size() + 2;
  EXPECT_EQ(buffer.size(), (terminator / 16 + 1) * 16);
  EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), slide.begin()));
  EXPECT_EQ(source.GetPullCount(), buffer.size() / 16);
}

TEST(HeaderScannerTest, HeaderEndsAtLastTagClose) {
  const auto slide = MakeSlide("<DataObject/>  \n  ", "");
  auto source = MemoryChunkSource::FromBytes(slide, 4);
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(location->header_size, 13u);
  EXPECT_EQ(location->chunk_size, 4u);
}

TEST(HeaderScannerTest, ChunkSizeIsFirstChunkLength) {
  std::vector<Chunk> chunks = {ToBytes("<a>"), ToBytes("text</a>"),
                               ToBytes("\r\n"), ToBytes(std::string(1, '\x04'))};
  MemoryChunkSource source(std::move(chunks));
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(location->chunk_size, 3u);
  EXPECT_EQ(location->header_size, 11u);
  EXPECT_EQ(buffer.size(), 14u);
}

TEST(HeaderScannerTest, SingleChunkSource) {
  const std::string header = testing::SampleHeader();
  const auto slide = MakeSlide(header, testing::Payload(50));
  auto source = MemoryChunkSource::FromBytes(slide, slide.size());
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(location->header_size, header.size());
  EXPECT_EQ(location->chunk_size, slide.size());
  EXPECT_EQ(buffer, slide);
}

TEST(HeaderScannerTest, HeaderSizeDoesNotDependOnChunking) {
  const std::string header = testing::SampleHeader();
  const auto slide = MakeSlide(header, testing::Payload(300));
  for (size_t chunk_size = 1; chunk_size <= slide.size(); chunk_size += 13) {
    auto source = MemoryChunkSource::FromBytes(slide, chunk_size);
    std::vector<uint8_t> buffer;
    auto location = FindHeader(source, buffer);
    ASSERT_TRUE(location.ok()) << chunk_size << ": " << location.status();
    EXPECT_EQ(location->header_size, header.size()) << chunk_size;
  }
}

TEST(HeaderScannerTest, PropagatesSourceErrors) {
  FailingChunkSource source;
  std::vector<uint8_t> buffer;
  auto location = FindHeader(source, buffer);
  ASSERT_FALSE(location.ok());
  EXPECT_EQ(location.status().code(), absl::StatusCode::kDataLoss);
  EXPECT_EQ(GetDeidErrorKind(location.status()), DeidErrorKind::kNone);
}

}  // namespace
}  // namespace isyntax
}  // namespace slidedeid
