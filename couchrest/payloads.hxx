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
#include <couchrest/revision.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace couchrest
{
/**
 * Result of creating, updating or deleting a document: `{"ok": true, "id": "...", "rev": "..."}`
 *
 * @since 1.0.0
 * @committed
 */
struct write_result {
  std::string id;
  revision rev;
};

/**
 * Document as read from the server.
 *
 * @since 1.0.0
 * @committed
 */
class document
{
public:
  document(std::string id, revision rev, bool deleted, tao::json::value content)
    : id_{ std::move(id) }
    , rev_{ std::move(rev) }
    , deleted_{ deleted }
    , content_{ std::move(content) }
  {
  }

  [[nodiscard]] auto id() const -> const std::string&
  {
    return id_;
  }

  [[nodiscard]] auto rev() const -> const revision&
  {
    return rev_;
  }

  [[nodiscard]] auto is_deleted() const -> bool
  {
    return deleted_;
  }

  /**
   * @return application fields of the document (all fields except the reserved ones, which start
   * with "_"), or @ref errors::document_is_deleted if this revision is a deletion tombstone
   */
  [[nodiscard]] auto content() const -> tl::expected<tao::json::value, error>;

private:
  std::string id_;
  revision rev_;
  bool deleted_;
  tao::json::value content_;
};

struct view_row {
  /// id of the emitting document, absent for reduced rows
  std::optional<std::string> id{};
  tao::json::value key{ tao::json::null };
  tao::json::value value{ tao::json::null };
};

/**
 * @since 1.0.0
 * @committed
 */
struct view_result {
  /// absent for reduced results
  std::optional<std::uint64_t> total_rows{};
  std::optional<std::uint64_t> offset{};
  std::vector<view_row> rows{};
};

namespace core
{
/**
 * Decoders of the successful response bodies. A body with unexpected structure yields
 * @ref errors::unexpected_response.
 */
auto
decode_write_result(const tao::json::value& body) -> tl::expected<write_result, error>;

auto
decode_document(const tao::json::value& body) -> tl::expected<document, error>;

auto
decode_view_result(const tao::json::value& body) -> tl::expected<view_result, error>;
} // namespace core
} // namespace couchrest
