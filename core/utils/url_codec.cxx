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

#include "url_codec.hxx"

#include <cstdint>

namespace couchrest::core::utils::string_codec
{
namespace priv
{
inline auto
unhex(char c) -> int
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

auto
unescape(std::string_view s, bool plus_is_space) -> std::optional<std::string>
{
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%') {
      if (i + 2 >= s.size()) {
        return {};
      }
      auto hi = unhex(s[i + 1]);
      auto lo = unhex(s[i + 2]);
      if (hi < 0 || lo < 0) {
        return {};
      }
      out.push_back(static_cast<char>((hi << 4U) | lo));
      i += 2;
    } else if (c == '+' && plus_is_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}
} // namespace priv

auto
path_unescape(std::string_view s) -> std::optional<std::string>
{
  return priv::unescape(s, false);
}

auto
query_unescape(std::string_view s) -> std::optional<std::string>
{
  return priv::unescape(s, true);
}

namespace v2
{
auto
should_escape(char c, encoding mode) -> bool
{
  // §2.3 Unreserved characters (alphanum)
  if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9')) {
    return false;
  }

  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      // §2.3 Unreserved characters (mark)
      return false;

    case '$':
    case '&':
    case '+':
    case ',':
    case '/':
    case ':':
    case ';':
    case '=':
    case '?':
    case '@':
      // §2.2 Reserved characters (reserved)
      // Different sections of the URL allow a few of
      // the reserved characters to appear unescaped.
      switch (mode) {
        case encoding::encode_path: // §3.3
          // The RFC allows : @ & = + $ but saves / ; , for assigning meaning to individual path
          // segments. This package only manipulates the path as a whole, so we allow those last
          // three as well. That leaves only ? to escape.
          return c == '?';

        case encoding::encode_path_segment: // §3.3
          // The RFC allows : @ & = + $ but saves / ; , for assigning meaning to individual path
          // segments.
          return c == '/' || c == ';' || c == ',' || c == '?';

        case encoding::encode_query_component: // §3.4
          // The RFC reserves (so we must escape) everything.
          return true;
      }
      break;

    default:
      break;
  }

  // Everything else must be escaped.
  return true;
}

constexpr auto upper_hex = "0123456789ABCDEF";

auto
escape(const std::string& s, encoding mode) -> std::string
{
  std::size_t space_count{ 0 };
  std::size_t hex_count{ 0 };

  for (const auto& c : s) {
    if (should_escape(c, mode)) {
      if (c == ' ' && mode == encoding::encode_query_component) {
        ++space_count;
      } else {
        ++hex_count;
      }
    }
  }

  if (space_count == 0 && hex_count == 0) {
    return s;
  }

  std::string t;
  t.reserve(s.size() + 2 * hex_count);
  for (const auto& c : s) {
    if (c == ' ' && mode == encoding::encode_query_component) {
      t.push_back('+');
    } else if (should_escape(c, mode)) {
      const auto byte = static_cast<std::uint8_t>(c);
      t.push_back('%');
      t.push_back(upper_hex[(byte >> 4U) & 0x0fU]);
      t.push_back(upper_hex[byte & 0x0fU]);
    } else {
      t.push_back(c);
    }
  }
  return t;
}
} // namespace v2

} // namespace couchrest::core::utils::string_codec
