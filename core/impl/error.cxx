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

#include <couchrest/error.hxx>

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>

namespace couchrest
{
namespace
{
template<typename... Handlers>
struct overloaded : Handlers... {
  using Handlers::operator()...;
};
template<typename... Handlers>
overloaded(Handlers...) -> overloaded<Handlers...>;

auto
is_error_status(std::uint32_t status_code) -> bool
{
  return status_code >= 400 && status_code < 600;
}

auto
format_error_response(const error_response& response) -> std::string
{
  return fmt::format("{}: {}", response.error(), response.reason());
}

auto
revision_parse_detail(const errors::revision_parse& kind) -> std::string
{
  switch (kind.kind) {
    case errc::revision_parse::digest_parse:
    case errc::revision_parse::number_parse:
      if (kind.cause) {
        return fmt::format("{}: {}", describe(kind.kind), kind.cause.message());
      }
      break;
    default:
      break;
  }
  return std::string{ describe(kind.kind) };
}

auto
path_parse_detail(const errors::path_parse& kind) -> std::string
{
  if (kind.detail.empty()) {
    return std::string{ describe(kind.kind) };
  }
  return fmt::format("{} ({})", describe(kind.kind), kind.detail);
}
} // namespace

auto
describe(errc::revision_parse kind) -> std::string_view
{
  switch (kind) {
    case errc::revision_parse::digest_not_all_hex:
      return "Digest part contains one or more non-hexadecimal characters";
    case errc::revision_parse::digest_parse:
      return "The digest part is invalid";
    case errc::revision_parse::number_parse:
      return "The number part is invalid";
    case errc::revision_parse::too_few_parts:
      return "Too few parts, missing number part and/or digest part";
    case errc::revision_parse::zero_sequence_number:
      return "The number part is zero";
  }
  return "Unknown revision parse error";
}

auto
describe(errc::path_parse kind) -> std::string_view
{
  switch (kind) {
    case errc::path_parse::bad_segment:
      return "Path segment is bad";
    case errc::path_parse::empty_segment:
      return "Path segment is empty";
    case errc::path_parse::no_leading_slash:
      return "Path does not begin with a slash";
    case errc::path_parse::too_few_segments:
      return "Too few path segments";
    case errc::path_parse::too_many_segments:
      return "Too many path segments";
    case errc::path_parse::trailing_slash:
      return "Path ends with a slash";
  }
  return "Unknown path parse error";
}

auto
status_reason_phrase(std::uint32_t status_code) -> std::string_view
{
  switch (status_code) {
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 304:
      return "Not Modified";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 406:
      return "Not Acceptable";
    case 409:
      return "Conflict";
    case 412:
      return "Precondition Failed";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
    case 416:
      return "Range Not Satisfiable";
    case 417:
      return "Expectation Failed";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      break;
  }
  return {};
}

auto
error::description() const -> std::string_view
{
  return std::visit(
    overloaded{
      [](const errors::database_exists&) -> std::string_view {
        return "The database already exists";
      },
      [](const errors::document_conflict&) -> std::string_view {
        return "A conflicting document with the same id exists";
      },
      [](const errors::document_is_deleted&) -> std::string_view {
        return "The document is deleted";
      },
      [](const errors::io& e) -> std::string_view {
        return e.description;
      },
      [](const errors::json_decode&) -> std::string_view {
        return "An error occurred while decoding JSON";
      },
      [](const errors::json_encode&) -> std::string_view {
        return "An error occurred while encoding JSON";
      },
      [](const errors::not_found&) -> std::string_view {
        return "The resource cannot be found";
      },
      [](const errors::path_parse&) -> std::string_view {
        return "The path is badly formatted";
      },
      [](const errors::response_not_json& e) -> std::string_view {
        if (e.content_type) {
          return "The response has non-JSON content";
        }
        return "The response content has no type";
      },
      [](const errors::revision_parse&) -> std::string_view {
        return "The revision is badly formatted";
      },
      [](const errors::server_response& e) -> std::string_view {
        if (is_error_status(e.status_code)) {
          return "The server responded with an error";
        }
        return "The server responded with an unexpected status";
      },
      [](const errors::transport& e) -> std::string_view {
        if (e.description.empty()) {
          return "An HTTP transport error occurred";
        }
        return e.description;
      },
      [](const errors::unauthorized&) -> std::string_view {
        return "The client has insufficient privilege";
      },
      [](const errors::unexpected_response&) -> std::string_view {
        return "The server responded unexpectedly";
      },
      [](const errors::url_not_scheme_relative&) -> std::string_view {
        return "The URL is not scheme relative";
      },
      [](const errors::url_parse&) -> std::string_view {
        return "The URL is badly formatted";
      },
    },
    kind_);
}

auto
error::message() const -> std::string
{
  auto description = this->description();
  return std::visit(
    overloaded{
      [description](const errors::database_exists& e) -> std::string {
        return fmt::format("{}: {}", description, format_error_response(e.response));
      },
      [description](const errors::document_conflict& e) -> std::string {
        return fmt::format("{}: {}", description, format_error_response(e.response));
      },
      [description](const errors::not_found& e) -> std::string {
        return fmt::format("{}: {}", description, format_error_response(e.response));
      },
      [description](const errors::unauthorized& e) -> std::string {
        return fmt::format("{}: {}", description, format_error_response(e.response));
      },
      [description](const errors::document_is_deleted&) -> std::string {
        return std::string{ description };
      },
      [description](const errors::io& e) -> std::string {
        return fmt::format("{}: {}", description, e.cause.message());
      },
      [description](const errors::json_decode& e) -> std::string {
        return fmt::format("{}: {}", description, e.cause);
      },
      [description](const errors::json_encode& e) -> std::string {
        return fmt::format("{}: {}", description, e.cause);
      },
      [description](const errors::path_parse& e) -> std::string {
        return fmt::format("{}: {}", description, path_parse_detail(e));
      },
      [description](const errors::response_not_json& e) -> std::string {
        if (e.content_type) {
          return fmt::format("{}: Content type is {}", description, e.content_type.value());
        }
        return std::string{ description };
      },
      [description](const errors::revision_parse& e) -> std::string {
        return fmt::format("{}: {}", description, revision_parse_detail(e));
      },
      [description](const errors::server_response& e) -> std::string {
        std::string message;
        if (auto phrase = status_reason_phrase(e.status_code); phrase.empty()) {
          message = fmt::format("{} ({})", description, e.status_code);
        } else {
          message = fmt::format("{} ({}: {})", description, e.status_code, phrase);
        }
        if (e.response) {
          message += fmt::format(": {}", format_error_response(e.response.value()));
        }
        return message;
      },
      [description](const errors::transport& e) -> std::string {
        return fmt::format("{}: {}", description, e.cause.message());
      },
      [description](const errors::unexpected_response& e) -> std::string {
        return fmt::format("{}: {}", description, e.description);
      },
      [description](const errors::url_not_scheme_relative&) -> std::string {
        return std::string{ description };
      },
      [description](const errors::url_parse& e) -> std::string {
        return fmt::format("{}: {}", description, e.cause);
      },
    },
    kind_);
}

auto
error::cause() const -> std::optional<std::string>
{
  return std::visit(
    overloaded{
      [](const errors::io& e) -> std::optional<std::string> {
        return e.cause.message();
      },
      [](const errors::json_decode& e) -> std::optional<std::string> {
        return e.cause;
      },
      [](const errors::json_encode& e) -> std::optional<std::string> {
        return e.cause;
      },
      [](const errors::revision_parse& e) -> std::optional<std::string> {
        if (e.cause) {
          return e.cause.message();
        }
        return {};
      },
      [](const errors::transport& e) -> std::optional<std::string> {
        return e.cause.message();
      },
      [](const errors::url_parse& e) -> std::optional<std::string> {
        return e.cause;
      },
      [](const auto&) -> std::optional<std::string> {
        return {};
      },
    },
    kind_);
}

auto
error::server_error() const -> const error_response*
{
  return std::visit(
    overloaded{
      [](const errors::database_exists& e) -> const error_response* {
        return &e.response;
      },
      [](const errors::document_conflict& e) -> const error_response* {
        return &e.response;
      },
      [](const errors::not_found& e) -> const error_response* {
        return &e.response;
      },
      [](const errors::unauthorized& e) -> const error_response* {
        return &e.response;
      },
      [](const errors::server_response& e) -> const error_response* {
        if (e.response) {
          return &e.response.value();
        }
        return nullptr;
      },
      [](const auto&) -> const error_response* {
        return nullptr;
      },
    },
    kind_);
}
} // namespace couchrest
