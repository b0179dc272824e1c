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

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace couchrest::core::utils::string_codec
{
/**
 * Decodes %XX sequences. Unlike query decoding, "+" is left as is.
 *
 * @return decoded string, or empty optional if the input has truncated or non-hexadecimal escape
 * sequence
 */
auto
path_unescape(std::string_view s) -> std::optional<std::string>;

/**
 * Decodes query component: %XX sequences and "+" as space.
 *
 * @return decoded string, or empty optional if the input has malformed escape sequence
 */
auto
query_unescape(std::string_view s) -> std::optional<std::string>;

namespace v2
{
enum class encoding {
  encode_path,
  encode_path_segment,
  encode_query_component,
};

auto
escape(const std::string& s, encoding mode) -> std::string;

/**
 * Escapes the string so it can be safely placed inside a URL query.
 *
 * @param s
 * @return
 */
inline auto
query_escape(const std::string& s) -> std::string
{
  return escape(s, encoding::encode_query_component);
}

/**
 * Escapes the string so it can be safely placed inside a URL path segment, replacing special
 * characters (including /) with %XX sequences as needed.
 */
inline auto
path_escape(const std::string& s) -> std::string
{
  return escape(s, encoding::encode_path_segment);
}

inline auto
form_encode(const std::map<std::string, std::string>& values) -> std::string
{
  std::stringstream ss;
  bool first{ true };
  for (const auto& [key, value] : values) {
    if (first) {
      first = false;
    } else {
      ss << '&';
    }
    ss << query_escape(key) << '=' << query_escape(value);
  }
  return ss.str();
}
} // namespace v2

} // namespace couchrest::core::utils::string_codec
