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
#include <couchrest/http_exchange.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace couchrest
{
/**
 * Purpose of the request, declared by the caller. The same status code means different things
 * for different intents, e.g. 409 Conflict is "database exists" for database creation and
 * "document conflict" for document writes.
 *
 * @since 1.0.0
 * @committed
 */
enum class request_intent {
  /// reading a document, attachment, design document or database information
  lookup,
  create_database,
  delete_database,
  /// creating, updating or deleting a document or design document
  document_write,
  view_query,
};

/**
 * @return true for "application/json", with or without parameters, in any letter case
 */
auto
is_json_content_type(std::string_view content_type) -> bool;

/**
 * Decodes the body as server error `{"error": "...", "reason": "..."}`.
 *
 * @return the decoded body, @ref errors::response_not_json when the content type is not JSON, or
 * @ref errors::json_decode when the body is malformed or either field is missing
 */
auto
decode_error_response(const http_exchange& exchange) -> tl::expected<error_response, error>;

/**
 * Maps the response to the JSON success body or exactly one error.
 *
 * Successful (2xx) responses must have JSON content type and well-formed body.
 */
auto
classify_response(request_intent intent, const http_exchange& exchange)
  -> tl::expected<tao::json::value, error>;

/**
 * Same as @ref classify_response, but on success returns the body as is, whatever its content
 * type is. Used for attachments.
 */
auto
classify_raw_response(request_intent intent, const http_exchange& exchange)
  -> tl::expected<std::string, error>;
} // namespace couchrest
