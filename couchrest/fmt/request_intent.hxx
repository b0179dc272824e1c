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

#include <couchrest/response_classifier.hxx>

#include <fmt/core.h>

/**
 * Helper for fmtlib to format @ref couchrest::request_intent objects.
 */
template<>
struct fmt::formatter<couchrest::request_intent> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(couchrest::request_intent intent, FormatContext& ctx) const
  {
    string_view name = "unknown";
    switch (intent) {
      case couchrest::request_intent::lookup:
        name = "lookup";
        break;
      case couchrest::request_intent::create_database:
        name = "create_database";
        break;
      case couchrest::request_intent::delete_database:
        name = "delete_database";
        break;
      case couchrest::request_intent::document_write:
        name = "document_write";
        break;
      case couchrest::request_intent::view_query:
        name = "view_query";
        break;
    }
    return format_to(ctx.out(), "{}", name);
  }
};
