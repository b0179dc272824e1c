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

#include "duration_parser.hxx"

#include <fmt/core.h>

#include <cstdint>
#include <limits>
#include <map>
#include <string_view>

namespace couchrest::core::utils
{
namespace
{
auto
unit_scale(std::string_view unit) -> std::uint64_t
{
  static const std::map<std::string_view, std::uint64_t> units{
    { "ns", 1ULL },
    { "us", 1'000ULL },
    { "\xc2\xb5s", 1'000ULL }, // U+00B5 micro sign
    { "\xce\xbcs", 1'000ULL }, // U+03BC greek small letter mu
    { "ms", 1'000'000ULL },
    { "s", 1'000'000'000ULL },
    { "m", 60ULL * 1'000'000'000ULL },
    { "h", 3600ULL * 1'000'000'000ULL },
  };
  if (auto it = units.find(unit); it != units.end()) {
    return it->second;
  }
  return 0;
}

auto
is_digit(char c) -> bool
{
  return c >= '0' && c <= '9';
}
} // namespace

auto
parse_duration(const std::string& text) -> std::chrono::nanoseconds
{
  std::string_view s{ text };
  bool negative = false;
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s == "0") {
    return std::chrono::nanoseconds::zero();
  }
  if (s.empty()) {
    throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
  }

  constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t total = 0;
  while (!s.empty()) {
    std::uint64_t whole = 0;
    std::size_t consumed = 0;
    while (consumed < s.size() && is_digit(s[consumed])) {
      auto digit = static_cast<std::uint64_t>(s[consumed] - '0');
      if (whole > (limit - digit) / 10) {
        throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
      }
      whole = whole * 10 + digit;
      ++consumed;
    }
    bool has_whole = consumed > 0;
    s.remove_prefix(consumed);

    std::uint64_t fraction = 0;
    std::uint64_t fraction_scale = 1;
    bool has_fraction = false;
    if (!s.empty() && s.front() == '.') {
      s.remove_prefix(1);
      consumed = 0;
      while (consumed < s.size() && is_digit(s[consumed])) {
        // digits past the precision of the accumulator are dropped
        if (fraction_scale <= limit / 10) {
          fraction = fraction * 10 + static_cast<std::uint64_t>(s[consumed] - '0');
          fraction_scale *= 10;
        }
        ++consumed;
      }
      has_fraction = consumed > 0;
      s.remove_prefix(consumed);
    }
    if (!has_whole && !has_fraction) {
      throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
    }

    consumed = 0;
    while (consumed < s.size() && s[consumed] != '.' && !is_digit(s[consumed])) {
      ++consumed;
    }
    if (consumed == 0) {
      throw duration_parse_error(fmt::format(R"(missing unit in duration "{}")", text));
    }
    auto scale = unit_scale(s.substr(0, consumed));
    if (scale == 0) {
      throw duration_parse_error(
        fmt::format(R"(unknown unit "{}" in duration "{}")", s.substr(0, consumed), text));
    }
    s.remove_prefix(consumed);

    if (whole > limit / scale) {
      throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
    }
    auto value = whole * scale;
    if (fraction > 0) {
      value += static_cast<std::uint64_t>(static_cast<long double>(fraction) *
                                          (static_cast<long double>(scale) /
                                           static_cast<long double>(fraction_scale)));
    }
    if (value > limit - total) {
      throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
    }
    total += value;
  }

  auto result = std::chrono::nanoseconds{ static_cast<std::int64_t>(total) };
  return negative ? -result : result;
}
} // namespace couchrest::core::utils
