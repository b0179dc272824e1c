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

#include <couchrest/error_codes.hxx>
#include <couchrest/error_response.hxx>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace couchrest
{
namespace errors
{
/**
 * The database already exists.
 */
struct database_exists {
  error_response response;
};

/**
 * A document with the same id already exists, or the given revision is not the latest revision
 * of the document.
 */
struct document_conflict {
  error_response response;
};

/**
 * The document exists, but the requested revision marks it as deleted.
 */
struct document_is_deleted {
};

/**
 * Local I/O failure, reported by @ref transport implementations (for example, when a response
 * body cannot be spooled to disk).
 */
struct io {
  std::error_code cause;
  std::string description{ "An I/O error occurred" };
};

/**
 * The body could not be decoded as JSON, or the JSON does not have the fields the decoded type
 * requires.
 */
struct json_decode {
  std::string cause;
};

struct json_encode {
  std::string cause;
};

/**
 * The target resource (database, document, etc.) does not exist or is deleted.
 */
struct not_found {
  error_response response;
};

struct path_parse {
  errc::path_parse kind;
  /// for errc::path_parse::bad_segment, what was wrong with the segment
  std::string detail{};
};

/**
 * The server responded with a content type other than JSON (or none at all).
 */
struct response_not_json {
  std::optional<std::string> content_type{};
};

struct revision_parse {
  errc::revision_parse kind;
  /// set for errc::revision_parse::number_parse and errc::revision_parse::digest_parse
  std::error_code cause{};
};

/**
 * The server responded with a status that the request does not map to any more specific error.
 *
 * The error body is empty when the server's body could not be decoded.
 */
struct server_response {
  std::uint32_t status_code;
  std::optional<error_response> response{};
};

/**
 * The HTTP transport failed before a complete response was received.
 */
struct transport {
  std::error_code cause;
  std::string description{};
};

/**
 * The client lacks permission to complete the action.
 */
struct unauthorized {
  error_response response;
};

/**
 * The server responded successfully, but the body does not have the expected structure.
 */
struct unexpected_response {
  std::string description;
};

/**
 * The URL has no authority part ("scheme://host"), so it cannot be used as a base for requests.
 */
struct url_not_scheme_relative {
};

struct url_parse {
  std::string cause;
};
} // namespace errors

/**
 * Closed set of failures reported by the library.
 *
 * Each alternative carries only the context relevant to that failure. Use @ref is, @ref get_if
 * or @ref visit to inspect it.
 *
 * @since 1.0.0
 * @committed
 */
class error
{
public:
  using kind_type = std::variant<errors::database_exists,
                                 errors::document_conflict,
                                 errors::document_is_deleted,
                                 errors::io,
                                 errors::json_decode,
                                 errors::json_encode,
                                 errors::not_found,
                                 errors::path_parse,
                                 errors::response_not_json,
                                 errors::revision_parse,
                                 errors::server_response,
                                 errors::transport,
                                 errors::unauthorized,
                                 errors::unexpected_response,
                                 errors::url_not_scheme_relative,
                                 errors::url_parse>;

private:
  template<typename T, typename Variant>
  struct is_alternative;

  template<typename T, typename... Kinds>
  struct is_alternative<T, std::variant<Kinds...>> : std::disjunction<std::is_same<T, Kinds>...> {
  };

public:
  template<typename Kind,
           std::enable_if_t<is_alternative<std::decay_t<Kind>, kind_type>::value, int> = 0>
  error(Kind&& kind)
    : kind_{ std::forward<Kind>(kind) }
  {
  }

  /**
   * @return short, static description of the failure class
   */
  [[nodiscard]] auto description() const -> std::string_view;

  /**
   * @return the description followed by the details of this failure, including the description
   * of the underlying cause when there is one
   */
  [[nodiscard]] auto message() const -> std::string;

  /**
   * @return the description of the underlying cause, if the failure wraps one
   */
  [[nodiscard]] auto cause() const -> std::optional<std::string>;

  /**
   * @return the body the server sent for the server-reported failures
   */
  [[nodiscard]] auto server_error() const -> const error_response*;

  [[nodiscard]] auto kind() const -> const kind_type&
  {
    return kind_;
  }

  template<typename Kind>
  [[nodiscard]] auto is() const -> bool
  {
    return std::holds_alternative<Kind>(kind_);
  }

  template<typename Kind>
  [[nodiscard]] auto get_if() const -> const Kind*
  {
    return std::get_if<Kind>(&kind_);
  }

  template<typename Visitor>
  decltype(auto) visit(Visitor&& visitor) const
  {
    return std::visit(std::forward<Visitor>(visitor), kind_);
  }

private:
  kind_type kind_;
};

/**
 * @return human-readable description of the revision parse rule
 */
auto
describe(errc::revision_parse kind) -> std::string_view;

/**
 * @return human-readable description of the path parse rule
 */
auto
describe(errc::path_parse kind) -> std::string_view;

/**
 * @return canonical reason phrase of the HTTP status code, or empty string if unknown
 */
auto
status_reason_phrase(std::uint32_t status_code) -> std::string_view;
} // namespace couchrest
