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

#include "slidedeid/errors.h"

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace slidedeid {

namespace {

// Payload values are the kind names; kNone is never stored.
std::optional<DeidErrorKind> ParseKindName(std::string_view name) {
  for (DeidErrorKind kind : {DeidErrorKind::kFormat, DeidErrorKind::kBarcode,
                             DeidErrorKind::kImages, DeidErrorKind::kLabel}) {
    if (GetName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace

absl::Status MakeDeidError(DeidErrorKind kind, absl::StatusCode code,
                           std::string_view message) {
  absl::Status status(code, message);
  if (kind != DeidErrorKind::kNone && !status.ok()) {
    status.SetPayload(kDeidErrorKindUrl, absl::Cord(GetName(kind)));
  }
  return status;
}

absl::Status FormatError(std::string_view message) {
  return MakeDeidError(DeidErrorKind::kFormat,
                       absl::StatusCode::kInvalidArgument, message);
}

absl::Status BarcodeError(absl::StatusCode code, std::string_view message) {
  return MakeDeidError(DeidErrorKind::kBarcode, code, message);
}

absl::Status ImagesError(absl::StatusCode code, std::string_view message) {
  return MakeDeidError(DeidErrorKind::kImages, code, message);
}

absl::Status LabelError(absl::StatusCode code, std::string_view message) {
  return MakeDeidError(DeidErrorKind::kLabel, code, message);
}

DeidErrorKind GetDeidErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return DeidErrorKind::kNone;
  }
  auto payload = status.GetPayload(kDeidErrorKindUrl);
  if (!payload.has_value()) {
    return DeidErrorKind::kNone;
  }
  return ParseKindName(std::string(*payload)).value_or(DeidErrorKind::kNone);
}

std::string_view GetName(DeidErrorKind kind) {
  switch (kind) {
    case DeidErrorKind::kNone:
      return "None";
    case DeidErrorKind::kFormat:
      return "FormatError";
    case DeidErrorKind::kBarcode:
      return "BarcodeError";
    case DeidErrorKind::kImages:
      return "ImagesError";
    case DeidErrorKind::kLabel:
      return "LabelError";
  }
  return "Unknown";
}

}  // namespace slidedeid
