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
#ifndef SLIDEDEID_INCLUDE_SLIDEDEID_STATUS_STATUS_MACROS_H_
#define SLIDEDEID_INCLUDE_SLIDEDEID_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"

/**
 * @file status_macros.h
 * @brief Traced status propagation for the slidedeid file layer and tool
 *
 * Each propagation step appends one "  at Fn (file:line) [CODE]" line to the
 * status message. The first line stays the root message, which is what
 * StripStackTrace returns and what tests compare against.
 *
 * Traced statuses keep their payloads. A deidentification failure carries
 * its DeidErrorKind as a payload (see slidedeid/errors.h), so
 * GetDeidErrorKind() gives the same answer before and after any number of
 * RETURN_IF_ERROR frames. The isyntax core returns its errors untraced; only
 * the file layer adds frames.
 */

namespace slidedeid::status {

/**
 * @brief One trace line: "  at Fn (file.cpp:123) [CODE] - message".
 *
 * The " - message" suffix is omitted when @p message is empty; the file
 * layer passes the path being processed here.
 */
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/**
 * @brief Returns the root error text of a traced message.
 *
 * Everything from the first "\n  at " onward is dropped.
 *
 * @param full_message The full status message, possibly containing frames.
 * @return The root message without any frames.
 */
inline std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find("\n  at "); pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/**
 * @brief Appends exactly one stack frame to a non-ok Status.
 *
 * The root text and the existing frames are kept in order, and every payload
 * of @p st is copied onto the result so typed error information (such as the
 * deidentification error kind) survives propagation.
 *
 * @param st        Original absl::Status.
 * @param function  Name of the calling function.
 * @param file      Source file path.
 * @param line      Source line number.
 * @param message   Optional per-frame message.
 * @return A new absl::Status with the appended frame, or @p st if ok.
 */
inline absl::Status AddTraceImpl(absl::Status const& st, char const* function,
                                 char const* file, int line,
                                 std::string_view message) {
  if (st.ok()) {
    return st;
  }

  std::string out = StripStackTrace(st.message());
  if (auto pos = st.message().find("\n  at "); pos != std::string_view::npos) {
    out.append(st.message().substr(pos));
  }
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](std::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

/// @brief StatusOr<T> overload; ok values pass through untouched.
template <typename T>
inline absl::StatusOr<T> AddTraceImpl(absl::StatusOr<T> const& sor,
                                      char const* function, char const* file,
                                      int line, std::string_view message) {
  if (sor.ok()) {
    return sor;
  }
  return AddTraceImpl(sor.status(), function, file, line, message);
}

/// @brief Append a frame to @p st; ok statuses are returned unchanged.
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  return AddTraceImpl(st, function, file, line, message);
}

/// @brief Append a frame to the status of @p sor; values pass through.
template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  return AddTraceImpl(sor, function, file, line, message);
}

}  // namespace slidedeid::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief New status with @p message as root text and a first frame.
 *
 * Used for I/O failures, which carry no DeidErrorKind.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                         \
  ::slidedeid::status::AddTrace(absl::Status((code), (message)), __func__, \
                                __FILE__, __LINE__, (message))

/**
 * @brief Propagate an absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Message for this frame (may be empty).
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                            \
  do {                                                                        \
    auto _st = (expr);                                                        \
    if (!_st.ok()) {                                                          \
      return ::slidedeid::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                           (msg));                            \
    }                                                                         \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * @param lhs   Target variable to assign.
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                      \
  do {                                                                        \
    auto _sor = (expr);                                                       \
    if (!_sor.ok()) {                                                         \
      return ::slidedeid::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                           __LINE__, ##__VA_ARGS__);          \
    }                                                                         \
    lhs = std::move(_sor.value());                                            \
  } while (0)

/**
 * @brief ASSIGN_OR_RETURN for move-only values such as FileHandle and
 *        isyntax::DeidentifyResult.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN_MOVE(lhs, expr, ...)                            \
  do {                                                                   \
    auto _status_or_result = (expr);                                     \
    if (!_status_or_result.ok()) {                                       \
      return ::slidedeid::status::AddTrace(_status_or_result.status(),   \
                                           __func__, __FILE__, __LINE__, \
                                           ##__VA_ARGS__);               \
    }                                                                    \
    lhs = std::move(_status_or_result).value();                          \
  } while (0)

#endif  // SLIDEDEID_INCLUDE_SLIDEDEID_STATUS_STATUS_MACROS_H_
