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

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace couchrest
{
/**
 * The map function and the optional reduce function of a view.
 *
 * @since 1.0.0
 * @committed
 */
class view_function
{
public:
  explicit view_function(std::string map)
    : map_{ std::move(map) }
  {
  }

  view_function(std::string map, std::string reduce)
    : map_{ std::move(map) }
    , reduce_{ std::move(reduce) }
  {
  }

  [[nodiscard]] auto map() const -> const std::string&
  {
    return map_;
  }

  [[nodiscard]] auto reduce() const -> const std::optional<std::string>&
  {
    return reduce_;
  }

  auto operator==(const view_function& other) const -> bool
  {
    return map_ == other.map_ && reduce_ == other.reduce_;
  }

  auto operator!=(const view_function& other) const -> bool
  {
    return !(*this == other);
  }

private:
  std::string map_;
  std::optional<std::string> reduce_{};
};

/**
 * Content of the design document. Only the "views" field is supported.
 *
 * Use @ref design_builder to create new content, or @ref from_json to decode the one read from
 * the server.
 *
 * @since 1.0.0
 * @committed
 */
class design
{
public:
  /**
   * Decodes design document. Fields other than "views" (like "_id", "_rev" or "language") are
   * ignored, and missing "views" field gives the design without views.
   *
   * @return the design, or @ref errors::json_decode
   */
  static auto from_json(std::string_view json) -> tl::expected<design, error>;

  /**
   * @return JSON text in form {"views": {"name": {"map": "...", "reduce": "..."}}}
   */
  [[nodiscard]] auto to_json() const -> std::string;

  [[nodiscard]] auto views() const -> const std::map<std::string, view_function>&
  {
    return views_;
  }

  auto operator==(const design& other) const -> bool
  {
    return views_ == other.views_;
  }

  auto operator!=(const design& other) const -> bool
  {
    return !(*this == other);
  }

private:
  friend class design_builder;

  design() = default;

  std::map<std::string, view_function> views_{};
};

/**
 * Accumulates views of the new design document.
 *
 * @since 1.0.0
 * @committed
 */
class design_builder
{
public:
  design_builder() = default;

  /**
   * Adds the view, replacing existing view with the same name.
   */
  auto insert_view(std::string name, view_function function) -> design_builder&
  {
    design_.views_.insert_or_assign(std::move(name), std::move(function));
    return *this;
  }

  [[nodiscard]] auto build() const -> design
  {
    return design_;
  }

private:
  design design_{};
};
} // namespace couchrest
