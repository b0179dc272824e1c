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

#include <cstdint>
#include <string>
#include <string_view>

namespace couchrest
{
/**
 * Revision of a document, as in "3-917fa2381192822767f010b95b45325b".
 *
 * The token consists of a positive sequence number and a hexadecimal digest. Revisions are
 * ordered by sequence number first, and then by digest (byte-wise, case-sensitive), which gives
 * every replica the same winner when resolving conflicts.
 *
 * Instances are only created by @ref parse or @ref make, so every revision object is valid.
 *
 * @since 1.0.0
 * @committed
 */
class revision
{
public:
  /**
   * Parses textual revision token.
   *
   * @param text token in "<sequence>-<digest>" form
   * @return the revision, or the rule that the token violates
   */
  static auto parse(std::string_view text) -> tl::expected<revision, errors::revision_parse>;

  /**
   * Builds revision from its parts, applying the same rules as @ref parse.
   */
  static auto make(std::uint64_t sequence, std::string digest)
    -> tl::expected<revision, errors::revision_parse>;

  [[nodiscard]] auto sequence() const -> std::uint64_t
  {
    return sequence_;
  }

  [[nodiscard]] auto digest() const -> const std::string&
  {
    return digest_;
  }

  /**
   * @return the token in "<sequence>-<digest>" form, the exact inverse of @ref parse
   */
  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const revision& other) const -> bool;
  auto operator!=(const revision& other) const -> bool;
  auto operator<(const revision& other) const -> bool;
  auto operator<=(const revision& other) const -> bool;
  auto operator>(const revision& other) const -> bool;
  auto operator>=(const revision& other) const -> bool;

private:
  revision(std::uint64_t sequence, std::string digest);

  std::uint64_t sequence_;
  std::string digest_;
};
} // namespace couchrest
