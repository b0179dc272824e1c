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

#include <couchrest/resource_path.hxx>

#include "core/utils/path_segment.hxx"

#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace couchrest
{
namespace
{
using core::utils::path_segment::pattern_entry;

constexpr std::string_view design_literal{ "_design" };
constexpr std::string_view view_literal{ "_view" };

auto
database_pattern() -> const std::vector<pattern_entry>&
{
  static const std::vector<pattern_entry> pattern{ pattern_entry{} };
  return pattern;
}

auto
document_pattern() -> const std::vector<pattern_entry>&
{
  static const std::vector<pattern_entry> pattern{ pattern_entry{}, pattern_entry{} };
  return pattern;
}

auto
attachment_pattern() -> const std::vector<pattern_entry>&
{
  static const std::vector<pattern_entry> pattern{
    pattern_entry{},
    pattern_entry{},
    pattern_entry{},
  };
  return pattern;
}

auto
design_document_pattern() -> const std::vector<pattern_entry>&
{
  static const std::vector<pattern_entry> pattern{
    pattern_entry{},
    pattern_entry{ design_literal },
    pattern_entry{},
  };
  return pattern;
}

auto
view_pattern() -> const std::vector<pattern_entry>&
{
  static const std::vector<pattern_entry> pattern{
    pattern_entry{}, pattern_entry{ design_literal }, pattern_entry{},
    pattern_entry{ view_literal }, pattern_entry{},
  };
  return pattern;
}

template<typename... Segments>
auto
validate_all(const Segments&... segments) -> std::optional<errors::path_parse>
{
  std::optional<errors::path_parse> failure{};
  // stop at the first failing segment
  ((failure = failure ? failure : core::utils::path_segment::validate(segments)), ...);
  return failure;
}
} // namespace

database_path::database_path(std::string name)
  : name_{ std::move(name) }
{
}

auto
database_path::make(std::string database) -> tl::expected<database_path, errors::path_parse>
{
  if (auto failure = validate_all(database); failure) {
    return tl::unexpected(failure.value());
  }
  return database_path{ std::move(database) };
}

auto
database_path::parse(std::string_view path) -> tl::expected<database_path, errors::path_parse>
{
  auto segments = core::utils::path_segment::split(path, database_pattern());
  if (!segments) {
    return tl::unexpected(segments.error());
  }
  return database_path{ std::move(segments.value()[0]) };
}

auto
database_path::document(std::string id) const -> tl::expected<document_path, errors::path_parse>
{
  return document_path::make(name_, std::move(id));
}

auto
database_path::design_document(std::string name) const
  -> tl::expected<design_document_path, errors::path_parse>
{
  return design_document_path::make(name_, std::move(name));
}

auto
database_path::to_string() const -> std::string
{
  return core::utils::path_segment::join({ name_ }, database_pattern());
}

auto
database_path::operator==(const database_path& other) const -> bool
{
  return name_ == other.name_;
}

auto
database_path::operator!=(const database_path& other) const -> bool
{
  return !(*this == other);
}

auto
database_path::operator<(const database_path& other) const -> bool
{
  return name_ < other.name_;
}

document_path::document_path(std::string database, std::string id)
  : database_{ std::move(database) }
  , id_{ std::move(id) }
{
}

auto
document_path::make(std::string database, std::string id)
  -> tl::expected<document_path, errors::path_parse>
{
  if (auto failure = validate_all(database, id); failure) {
    return tl::unexpected(failure.value());
  }
  return document_path{ std::move(database), std::move(id) };
}

auto
document_path::parse(std::string_view path) -> tl::expected<document_path, errors::path_parse>
{
  auto segments = core::utils::path_segment::split(path, document_pattern());
  if (!segments) {
    return tl::unexpected(segments.error());
  }
  auto& parts = segments.value();
  return document_path{ std::move(parts[0]), std::move(parts[1]) };
}

auto
document_path::database() const -> database_path
{
  return database_path{ database_ };
}

auto
document_path::attachment(std::string name) const
  -> tl::expected<attachment_path, errors::path_parse>
{
  return attachment_path::make(database_, id_, std::move(name));
}

auto
document_path::to_string() const -> std::string
{
  return core::utils::path_segment::join({ database_, id_ }, document_pattern());
}

auto
document_path::operator==(const document_path& other) const -> bool
{
  return database_ == other.database_ && id_ == other.id_;
}

auto
document_path::operator!=(const document_path& other) const -> bool
{
  return !(*this == other);
}

auto
document_path::operator<(const document_path& other) const -> bool
{
  return std::tie(database_, id_) < std::tie(other.database_, other.id_);
}

attachment_path::attachment_path(std::string database, std::string id, std::string name)
  : database_{ std::move(database) }
  , id_{ std::move(id) }
  , name_{ std::move(name) }
{
}

auto
attachment_path::make(std::string database, std::string id, std::string name)
  -> tl::expected<attachment_path, errors::path_parse>
{
  if (auto failure = validate_all(database, id, name); failure) {
    return tl::unexpected(failure.value());
  }
  return attachment_path{ std::move(database), std::move(id), std::move(name) };
}

auto
attachment_path::parse(std::string_view path) -> tl::expected<attachment_path, errors::path_parse>
{
  auto segments = core::utils::path_segment::split(path, attachment_pattern());
  if (!segments) {
    return tl::unexpected(segments.error());
  }
  auto& parts = segments.value();
  return attachment_path{ std::move(parts[0]), std::move(parts[1]), std::move(parts[2]) };
}

auto
attachment_path::database() const -> database_path
{
  return database_path{ database_ };
}

auto
attachment_path::document() const -> document_path
{
  return document_path{ database_, id_ };
}

auto
attachment_path::to_string() const -> std::string
{
  return core::utils::path_segment::join({ database_, id_, name_ }, attachment_pattern());
}

auto
attachment_path::operator==(const attachment_path& other) const -> bool
{
  return database_ == other.database_ && id_ == other.id_ && name_ == other.name_;
}

auto
attachment_path::operator!=(const attachment_path& other) const -> bool
{
  return !(*this == other);
}

auto
attachment_path::operator<(const attachment_path& other) const -> bool
{
  return std::tie(database_, id_, name_) < std::tie(other.database_, other.id_, other.name_);
}

design_document_path::design_document_path(std::string database, std::string name)
  : database_{ std::move(database) }
  , name_{ std::move(name) }
{
}

auto
design_document_path::make(std::string database, std::string name)
  -> tl::expected<design_document_path, errors::path_parse>
{
  if (auto failure = validate_all(database, name); failure) {
    return tl::unexpected(failure.value());
  }
  return design_document_path{ std::move(database), std::move(name) };
}

auto
design_document_path::parse(std::string_view path)
  -> tl::expected<design_document_path, errors::path_parse>
{
  auto segments = core::utils::path_segment::split(path, design_document_pattern());
  if (!segments) {
    return tl::unexpected(segments.error());
  }
  auto& parts = segments.value();
  return design_document_path{ std::move(parts[0]), std::move(parts[1]) };
}

auto
design_document_path::database() const -> database_path
{
  return database_path{ database_ };
}

auto
design_document_path::view(std::string name) const -> tl::expected<view_path, errors::path_parse>
{
  return view_path::make(database_, name_, std::move(name));
}

auto
design_document_path::to_string() const -> std::string
{
  return core::utils::path_segment::join({ database_, name_ }, design_document_pattern());
}

auto
design_document_path::operator==(const design_document_path& other) const -> bool
{
  return database_ == other.database_ && name_ == other.name_;
}

auto
design_document_path::operator!=(const design_document_path& other) const -> bool
{
  return !(*this == other);
}

auto
design_document_path::operator<(const design_document_path& other) const -> bool
{
  return std::tie(database_, name_) < std::tie(other.database_, other.name_);
}

view_path::view_path(std::string database, std::string design_document, std::string name)
  : database_{ std::move(database) }
  , design_document_{ std::move(design_document) }
  , name_{ std::move(name) }
{
}

auto
view_path::make(std::string database, std::string design_document, std::string name)
  -> tl::expected<view_path, errors::path_parse>
{
  if (auto failure = validate_all(database, design_document, name); failure) {
    return tl::unexpected(failure.value());
  }
  return view_path{ std::move(database), std::move(design_document), std::move(name) };
}

auto
view_path::parse(std::string_view path) -> tl::expected<view_path, errors::path_parse>
{
  auto segments = core::utils::path_segment::split(path, view_pattern());
  if (!segments) {
    return tl::unexpected(segments.error());
  }
  auto& parts = segments.value();
  return view_path{ std::move(parts[0]), std::move(parts[1]), std::move(parts[2]) };
}

auto
view_path::database() const -> database_path
{
  return database_path{ database_ };
}

auto
view_path::design_document() const -> design_document_path
{
  return design_document_path{ database_, design_document_ };
}

auto
view_path::to_string() const -> std::string
{
  return core::utils::path_segment::join({ database_, design_document_, name_ }, view_pattern());
}

auto
view_path::operator==(const view_path& other) const -> bool
{
  return database_ == other.database_ && design_document_ == other.design_document_ &&
         name_ == other.name_;
}

auto
view_path::operator!=(const view_path& other) const -> bool
{
  return !(*this == other);
}

auto
view_path::operator<(const view_path& other) const -> bool
{
  return std::tie(database_, design_document_, name_) <
         std::tie(other.database_, other.design_document_, other.name_);
}
} // namespace couchrest
