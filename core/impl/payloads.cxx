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

#include <couchrest/payloads.hxx>

#include <tao/json.hpp>

#include <fmt/core.h>

#include <utility>

namespace couchrest
{
namespace
{
auto
unexpected_shape(std::string description) -> tl::unexpected<error>
{
  return tl::unexpected<error>(errors::unexpected_response{ std::move(description) });
}

auto
is_non_negative_integer(const tao::json::value& value) -> bool
{
  return value.is_unsigned() || (value.is_signed() && value.get_signed() >= 0);
}

auto
decode_revision(const tao::json::value& body, const std::string& field)
  -> tl::expected<revision, error>
{
  const auto* rev = body.find(field);
  if (rev == nullptr || !rev->is_string()) {
    return unexpected_shape(fmt::format(R"(missing string field "{}")", field));
  }
  auto parsed = revision::parse(rev->get_string());
  if (!parsed) {
    return unexpected_shape(fmt::format(
      R"(field "{}" is not a valid revision: {})", field, error{ parsed.error() }.message()));
  }
  return parsed.value();
}
} // namespace

auto
document::content() const -> tl::expected<tao::json::value, error>
{
  if (deleted_) {
    return tl::unexpected(errors::document_is_deleted{});
  }
  return content_;
}

namespace core
{
auto
decode_write_result(const tao::json::value& body) -> tl::expected<write_result, error>
{
  if (!body.is_object()) {
    return unexpected_shape("write result must be a JSON object");
  }
  const auto* id = body.find("id");
  if (id == nullptr || !id->is_string()) {
    return unexpected_shape(R"(missing string field "id")");
  }
  auto rev = decode_revision(body, "rev");
  if (!rev) {
    return tl::unexpected(rev.error());
  }
  return write_result{ id->get_string(), std::move(rev.value()) };
}

auto
decode_document(const tao::json::value& body) -> tl::expected<document, error>
{
  if (!body.is_object()) {
    return unexpected_shape("document must be a JSON object");
  }
  const auto* id = body.find("_id");
  if (id == nullptr || !id->is_string()) {
    return unexpected_shape(R"(missing string field "_id")");
  }
  auto rev = decode_revision(body, "_rev");
  if (!rev) {
    return tl::unexpected(rev.error());
  }
  bool deleted = false;
  if (const auto* flag = body.find("_deleted"); flag != nullptr) {
    if (!flag->is_boolean()) {
      return unexpected_shape(R"(field "_deleted" must be a boolean)");
    }
    deleted = flag->get_boolean();
  }

  tao::json::value content = tao::json::empty_object;
  for (const auto& [name, value] : body.get_object()) {
    if (name.empty() || name.front() != '_') {
      content[name] = value;
    }
  }
  return document{ id->get_string(), std::move(rev.value()), deleted, std::move(content) };
}

auto
decode_view_result(const tao::json::value& body) -> tl::expected<view_result, error>
{
  if (!body.is_object()) {
    return unexpected_shape("view result must be a JSON object");
  }
  view_result result{};
  if (const auto* total_rows = body.find("total_rows"); total_rows != nullptr) {
    if (!is_non_negative_integer(*total_rows)) {
      return unexpected_shape(R"(field "total_rows" must be a non-negative integer)");
    }
    result.total_rows = total_rows->as<std::uint64_t>();
  }
  if (const auto* offset = body.find("offset"); offset != nullptr) {
    if (!is_non_negative_integer(*offset)) {
      return unexpected_shape(R"(field "offset" must be a non-negative integer)");
    }
    result.offset = offset->as<std::uint64_t>();
  }

  const auto* rows = body.find("rows");
  if (rows == nullptr || !rows->is_array()) {
    return unexpected_shape(R"(missing array field "rows")");
  }
  for (const auto& entry : rows->get_array()) {
    if (!entry.is_object()) {
      return unexpected_shape("view row must be a JSON object");
    }
    view_row row{};
    if (const auto* id = entry.find("id"); id != nullptr && id->is_string()) {
      row.id = id->get_string();
    }
    if (const auto* key = entry.find("key"); key != nullptr) {
      row.key = *key;
    }
    if (const auto* value = entry.find("value"); value != nullptr) {
      row.value = *value;
    }
    result.rows.emplace_back(std::move(row));
  }
  return result;
}
} // namespace core
} // namespace couchrest
