/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2026-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <string>
#include <utility>

namespace couchrest
{
/**
 * Error information returned by the server when it fails to process the request.
 *
 * The wire form is `{"error": "...", "reason": "..."}`, both fields are mandatory.
 *
 * @since 1.0.0
 * @committed
 */
class error_response
{
public:
  error_response(std::string error, std::string reason)
    : error_{ std::move(error) }
    , reason_{ std::move(reason) }
  {
  }

  /**
   * @return the high-level name of the error, e.g. "file_exists"
   */
  [[nodiscard]] auto error() const -> const std::string&
  {
    return error_;
  }

  /**
   * @return the human-readable description, e.g. "The database could not be created, the file
   * already exists."
   */
  [[nodiscard]] auto reason() const -> const std::string&
  {
    return reason_;
  }

  auto operator==(const error_response& other) const -> bool
  {
    return error_ == other.error_ && reason_ == other.reason_;
  }

  auto operator!=(const error_response& other) const -> bool
  {
    return !(*this == other);
  }

  auto operator<(const error_response& other) const -> bool
  {
    if (error_ == other.error_) {
      return reason_ < other.reason_;
    }
    return error_ < other.error_;
  }

private:
  std::string error_;
  std::string reason_;
};
} // namespace couchrest
