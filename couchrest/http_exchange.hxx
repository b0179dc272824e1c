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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace couchrest
{
struct http_request {
  std::string method{ "GET" };
  /// path with the server prefix, percent-encoded, without query string
  std::string path{};
  /// encoded query string, without leading "?"
  std::string query{};
  std::map<std::string, std::string> headers{};
  std::string body{};
  std::chrono::milliseconds timeout{};
  /// largest response body the transport should read, zero means no limit
  std::size_t max_body_size{ 0 };
};

/**
 * Response as seen by the classifier: status, media type and the full body.
 */
struct http_exchange {
  std::uint32_t status_code{ 0 };
  std::optional<std::string> content_type{};
  std::string body{};
  std::map<std::string, std::string> headers{};
};
} // namespace couchrest
