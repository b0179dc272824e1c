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

#include <couchrest/error.hxx>

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace couchrest::core::utils::path_segment
{
constexpr char separator{ '/' };

/**
 * Checks single logical segment (database name, document id, etc.). The segment must not be
 * empty and must not contain the path separator.
 */
auto
validate(std::string_view segment) -> std::optional<errors::path_parse>;

/**
 * Percent-encodes segment for placing it into the request path.
 */
auto
encode(const std::string& segment) -> std::string;

/**
 * Describes one position of the path template for the resource kind: either a literal (like
 * "_design") or a placeholder for a logical segment.
 */
struct pattern_entry {
  std::optional<std::string_view> literal{};
};

/**
 * Splits already-formed path according to the pattern.
 *
 * Checks the leading and trailing separators, the number of segments and the literals. Every
 * placeholder segment is percent-decoded and validated with @ref validate.
 *
 * @return decoded logical segments (literals are not included)
 */
auto
split(std::string_view path, const std::vector<pattern_entry>& pattern)
  -> tl::expected<std::vector<std::string>, errors::path_parse>;

/**
 * Renders the logical segments according to the pattern, always with a leading separator and
 * never with a trailing one.
 */
auto
join(const std::vector<std::string>& segments, const std::vector<pattern_entry>& pattern)
  -> std::string;
} // namespace couchrest::core::utils::path_segment
