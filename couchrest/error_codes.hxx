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

#include <system_error>

namespace couchrest
{
#ifndef COUCHREST_DOXYGEN
namespace core::impl
{
auto
revision_parse_category() noexcept -> const std::error_category&;

auto
path_parse_category() noexcept -> const std::error_category&;
} // namespace core::impl
#endif

namespace errc
{
/**
 * Structural rules a revision token ("<sequence>-<digest>") can violate.
 *
 * @since 1.0.0
 * @committed
 */
enum class revision_parse {
  /**
   * The digest part contains one or more non-hexadecimal characters.
   */
  digest_not_all_hex = 1,

  /**
   * The digest part is made of hexadecimal characters, but does not form a valid digest (for
   * example, it is empty).
   */
  digest_parse = 2,

  /**
   * The sequence number part is not a decimal number that fits into 64 bits.
   */
  number_parse = 3,

  /**
   * The token has no "-" separator, so either the number part or the digest part is missing.
   */
  too_few_parts = 4,

  /**
   * The sequence number is zero. Revision numbering starts at 1.
   */
  zero_sequence_number = 5,
};

/**
 * Structural rules a resource path can violate.
 *
 * @since 1.0.0
 * @committed
 */
enum class path_parse {
  /**
   * A segment has unexpected content: an embedded separator, a malformed percent-escape, or a
   * literal segment (like "_design" or "_view") that does not match.
   */
  bad_segment = 1,

  /**
   * A segment is empty.
   */
  empty_segment = 2,

  /**
   * The path does not begin with "/".
   */
  no_leading_slash = 3,

  /**
   * The path has fewer segments than the resource kind requires.
   */
  too_few_segments = 4,

  /**
   * The path has more segments than the resource kind allows.
   */
  too_many_segments = 5,

  /**
   * The path ends with "/".
   */
  trailing_slash = 6,
};

inline auto
make_error_code(revision_parse e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::revision_parse_category() };
}

inline auto
make_error_code(path_parse e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::path_parse_category() };
}
} // namespace errc
} // namespace couchrest

template<>
struct std::is_error_code_enum<couchrest::errc::revision_parse> : std::true_type {
};

template<>
struct std::is_error_code_enum<couchrest::errc::path_parse> : std::true_type {
};
