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

#include <couchrest/design.hxx>

#include <tao/json/value.hpp>

#include <stdexcept>

namespace tao::json
{
template<>
struct traits<couchrest::view_function> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const couchrest::view_function& function)
  {
    v = tao::json::empty_object;
    v["map"] = function.map();
    if (const auto& reduce = function.reduce(); reduce) {
      v["reduce"] = reduce.value();
    }
  }

  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> couchrest::view_function
  {
    if (!v.is_object()) {
      throw std::invalid_argument("view function must be a JSON object");
    }
    const auto* map = v.find("map");
    if (map == nullptr) {
      throw std::invalid_argument(R"(missing field "map")");
    }
    if (!map->is_string()) {
      throw std::invalid_argument(R"(field "map" must be a string)");
    }
    if (const auto* reduce = v.find("reduce"); reduce != nullptr && !reduce->is_null()) {
      if (!reduce->is_string()) {
        throw std::invalid_argument(R"(field "reduce" must be a string)");
      }
      return couchrest::view_function{ map->get_string(), reduce->get_string() };
    }
    return couchrest::view_function{ map->get_string() };
  }
};

template<>
struct traits<couchrest::design> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const couchrest::design& design)
  {
    v = tao::json::empty_object;
    auto& views = v["views"];
    views = tao::json::empty_object;
    for (const auto& [name, function] : design.views()) {
      views[name] = function;
    }
  }

  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> couchrest::design
  {
    if (!v.is_object()) {
      throw std::invalid_argument("design document must be a JSON object");
    }
    couchrest::design_builder builder{};
    if (const auto* views = v.find("views"); views != nullptr) {
      if (!views->is_object()) {
        throw std::invalid_argument(R"(field "views" must be a JSON object)");
      }
      for (const auto& [name, function] : views->get_object()) {
        builder.insert_view(name, function.template as<couchrest::view_function>());
      }
    }
    return builder.build();
  }
};
} // namespace tao::json

namespace couchrest::core
{
/**
 * @return the design, or @ref errors::json_decode when the value does not have the structure of
 * the design document
 */
auto
decode_design(const tao::json::value& value) -> tl::expected<design, error>;
} // namespace couchrest::core
