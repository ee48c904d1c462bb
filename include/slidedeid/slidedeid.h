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

#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_SLIDEDEID_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_SLIDEDEID_H_

/**
 * @file slidedeid.h
 * @brief Main header for the slidedeid library
 *
 * slidedeid removes patient-identifying metadata from whole-slide images
 * without rewriting their pixel data. It currently supports the Philips
 * iSyntax container, whose XML header carries the specimen barcode and a
 * reference to the slide label photograph.
 *
 * Layers:
 * - **Runtime**: chunked byte streams and file handles
 * - **Formats**: format-specific header scanning and rewriting
 * - **Files**: new-file and in-place deidentification on disk
 *
 * @see slidedeid/runtime/io/ for streams and files
 * @see slidedeid/formats/isyntax/ for the iSyntax header rewrite
 */

// ============================================================================
// Errors
// ============================================================================

#include "slidedeid/errors.h"

// ============================================================================
// Runtime Services
// ============================================================================

#include "slidedeid/runtime/io/chunk_source.h"
#include "slidedeid/runtime/io/file_chunk_source.h"
#include "slidedeid/runtime/io/file_handle.h"

// ============================================================================
// Formats
// ============================================================================

#include "slidedeid/formats/isyntax/deidentifier.h"
#include "slidedeid/formats/isyntax/header_inspector.h"

// ============================================================================
// Public API
// ============================================================================

#include "slidedeid/deidentify_file.h"

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_SLIDEDEID_H_
