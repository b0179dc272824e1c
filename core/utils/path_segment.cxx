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

#include "path_segment.hxx"

#include "url_codec.hxx"

#include <fmt/core.h>

namespace couchrest::core::utils::path_segment
{
namespace
{
auto
split_raw(std::string_view path) -> std::vector<std::string_view>
{
  std::vector<std::string_view> raw{};
  std::size_t start = 0;
  while (true) {
    auto next = path.find(separator, start);
    if (next == std::string_view::npos) {
      raw.emplace_back(path.substr(start));
      break;
    }
    raw.emplace_back(path.substr(start, next - start));
    start = next + 1;
  }
  return raw;
}
} // namespace

auto
validate(std::string_view segment) -> std::optional<errors::path_parse>
{
  if (segment.empty()) {
    return errors::path_parse{ errc::path_parse::empty_segment };
  }
  if (segment.find(separator) != std::string_view::npos) {
    return errors::path_parse{ errc::path_parse::bad_segment,
                               fmt::format(R"(unexpected separator "{}")", separator) };
  }
  return {};
}

auto
encode(const std::string& segment) -> std::string
{
  return string_codec::v2::path_escape(segment);
}

auto
split(std::string_view path, const std::vector<pattern_entry>& pattern)
  -> tl::expected<std::vector<std::string>, errors::path_parse>
{
  if (path.empty() || path.front() != separator) {
    return tl::unexpected(errors::path_parse{ errc::path_parse::no_leading_slash });
  }
  if (path.size() > 1 && path.back() == separator) {
    return tl::unexpected(errors::path_parse{ errc::path_parse::trailing_slash });
  }

  auto raw = split_raw(path.substr(1));
  for (const auto& segment : raw) {
    if (segment.empty()) {
      return tl::unexpected(errors::path_parse{ errc::path_parse::empty_segment });
    }
  }
  if (raw.size() < pattern.size()) {
    return tl::unexpected(errors::path_parse{ errc::path_parse::too_few_segments });
  }
  if (raw.size() > pattern.size()) {
    return tl::unexpected(errors::path_parse{ errc::path_parse::too_many_segments });
  }

  std::vector<std::string> segments{};
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (const auto& literal = pattern[i].literal; literal) {
      if (raw[i] != literal.value()) {
        return tl::unexpected(errors::path_parse{ errc::path_parse::bad_segment,
                                                  fmt::format(R"(expected "{}")", literal.value()) });
      }
      continue;
    }
    auto decoded = string_codec::path_unescape(raw[i]);
    if (!decoded) {
      return tl::unexpected(
        errors::path_parse{ errc::path_parse::bad_segment, "invalid percent-encoding" });
    }
    if (auto failure = validate(decoded.value()); failure) {
      return tl::unexpected(failure.value());
    }
    segments.emplace_back(std::move(decoded.value()));
  }
  return segments;
}

auto
join(const std::vector<std::string>& segments, const std::vector<pattern_entry>& pattern)
  -> std::string
{
  std::string path{};
  auto segment = segments.begin();
  for (const auto& entry : pattern) {
    path.push_back(separator);
    if (entry.literal) {
      path.append(entry.literal.value());
    } else if (segment != segments.end()) {
      path.append(encode(*segment));
      ++segment;
    }
  }
  return path;
}
} // namespace couchrest::core::utils::path_segment
