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

#include <couchrest/error_codes.hxx>

#include <string>

namespace couchrest::core::impl
{

struct path_parse_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "couchrest.path_parse";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::path_parse>(ev)) {
      case errc::path_parse::bad_segment:
        return "bad_segment (1)";
      case errc::path_parse::empty_segment:
        return "empty_segment (2)";
      case errc::path_parse::no_leading_slash:
        return "no_leading_slash (3)";
      case errc::path_parse::too_few_segments:
        return "too_few_segments (4)";
      case errc::path_parse::too_many_segments:
        return "too_many_segments (5)";
      case errc::path_parse::trailing_slash:
        return "trailing_slash (6)";
    }
    return "FIXME: unknown error code (recompile with newer library): couchrest.path_parse." +
           std::to_string(ev);
  }
};

const inline static path_parse_error_category category_instance;

auto
path_parse_category() noexcept -> const std::error_category&
{
  return category_instance;
}

} // namespace couchrest::core::impl
