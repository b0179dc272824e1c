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

struct revision_parse_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "couchrest.revision_parse";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::revision_parse>(ev)) {
      case errc::revision_parse::digest_not_all_hex:
        return "digest_not_all_hex (1)";
      case errc::revision_parse::digest_parse:
        return "digest_parse (2)";
      case errc::revision_parse::number_parse:
        return "number_parse (3)";
      case errc::revision_parse::too_few_parts:
        return "too_few_parts (4)";
      case errc::revision_parse::zero_sequence_number:
        return "zero_sequence_number (5)";
    }
    return "FIXME: unknown error code (recompile with newer library): couchrest.revision_parse." +
           std::to_string(ev);
  }
};

const inline static revision_parse_error_category category_instance;

auto
revision_parse_category() noexcept -> const std::error_category&
{
  return category_instance;
}

} // namespace couchrest::core::impl
