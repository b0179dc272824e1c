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

#include "core/design_json.hxx"

#include "core/utils/json.hxx"

#include <tao/json.hpp>

#include <exception>

namespace couchrest
{
namespace core
{
auto
decode_design(const tao::json::value& value) -> tl::expected<design, error>
{
  if (!value.is_object()) {
    return tl::unexpected(errors::json_decode{ "design document must be a JSON object" });
  }
  try {
    return value.as<design>();
  } catch (const std::exception& e) {
    return tl::unexpected(errors::json_decode{ e.what() });
  }
}
} // namespace core

auto
design::from_json(std::string_view json) -> tl::expected<design, error>
{
  tao::json::value value;
  try {
    value = core::utils::json::parse(json);
  } catch (const tao::pegtl::parse_error& e) {
    return tl::unexpected(errors::json_decode{ e.what() });
  }
  return core::decode_design(value);
}

auto
design::to_json() const -> std::string
{
  return core::utils::json::generate(tao::json::value(*this));
}
} // namespace couchrest
