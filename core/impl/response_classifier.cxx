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

#include <couchrest/response_classifier.hxx>

#include <couchrest/fmt/error.hxx>
#include <couchrest/fmt/request_intent.hxx>

#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <tao/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace couchrest
{
namespace
{
constexpr std::string_view json_media_type{ "application/json" };

auto
is_success(std::uint32_t status_code) -> bool
{
  return status_code >= 200 && status_code < 300;
}

auto
trim(std::string_view text) -> std::string_view
{
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

auto
parse_json_body(const http_exchange& exchange) -> tl::expected<tao::json::value, error>
{
  if (!exchange.content_type || !is_json_content_type(exchange.content_type.value())) {
    return tl::unexpected(errors::response_not_json{ exchange.content_type });
  }
  try {
    return core::utils::json::parse(exchange.body);
  } catch (const tao::pegtl::parse_error& e) {
    return tl::unexpected(errors::json_decode{ e.what() });
  }
}

auto
string_member(const tao::json::value& object, const std::string& name)
  -> tl::expected<std::string, error>
{
  const auto* member = object.find(name);
  if (member == nullptr) {
    return tl::unexpected(errors::json_decode{ fmt::format(R"(missing field "{}")", name) });
  }
  if (!member->is_string()) {
    return tl::unexpected(
      errors::json_decode{ fmt::format(R"(field "{}" must be a string)", name) });
  }
  return member->get_string();
}

template<typename Kind>
auto
semantic_failure(const http_exchange& exchange) -> error
{
  auto response = decode_error_response(exchange);
  if (!response) {
    return response.error();
  }
  return Kind{ std::move(response.value()) };
}

auto
generic_failure(const http_exchange& exchange) -> error
{
  std::optional<error_response> response{};
  if (auto decoded = decode_error_response(exchange); decoded) {
    response = std::move(decoded.value());
  }
  return errors::server_response{ exchange.status_code, std::move(response) };
}

/**
 * @return the error for non-2xx status, or empty optional for 2xx
 */
auto
classify_status(request_intent intent, const http_exchange& exchange) -> std::optional<error>
{
  if (is_success(exchange.status_code)) {
    return {};
  }

  switch (exchange.status_code) {
    case 401:
    case 403:
      return semantic_failure<errors::unauthorized>(exchange);

    case 404:
      return semantic_failure<errors::not_found>(exchange);

    case 409:
      if (intent == request_intent::create_database) {
        return semantic_failure<errors::database_exists>(exchange);
      }
      if (intent == request_intent::document_write) {
        return semantic_failure<errors::document_conflict>(exchange);
      }
      break;

    case 412:
      if (intent == request_intent::create_database) {
        return semantic_failure<errors::database_exists>(exchange);
      }
      break;

    default:
      break;
  }
  return generic_failure(exchange);
}

void
log_failure(request_intent intent, const http_exchange& exchange, const error& failure)
{
  CR_LOG_DEBUG("{} request failed, status={}, content_type=\"{}\": {}",
               intent,
               exchange.status_code,
               exchange.content_type.value_or(""),
               failure);
}
} // namespace

auto
is_json_content_type(std::string_view content_type) -> bool
{
  auto media_type = trim(content_type.substr(0, content_type.find(';')));
  return media_type.size() == json_media_type.size() &&
         std::equal(media_type.begin(),
                    media_type.end(),
                    json_media_type.begin(),
                    [](char lhs, char rhs) {
                      return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
                    });
}

auto
decode_error_response(const http_exchange& exchange) -> tl::expected<error_response, error>
{
  auto body = parse_json_body(exchange);
  if (!body) {
    return tl::unexpected(body.error());
  }
  if (!body->is_object()) {
    return tl::unexpected(errors::json_decode{ "error body must be a JSON object" });
  }
  for (const auto& [name, member] : body->get_object()) {
    if (name != "error" && name != "reason") {
      return tl::unexpected(errors::json_decode{ fmt::format(R"(unknown field "{}")", name) });
    }
  }
  auto error_code = string_member(body.value(), "error");
  if (!error_code) {
    return tl::unexpected(error_code.error());
  }
  auto reason = string_member(body.value(), "reason");
  if (!reason) {
    return tl::unexpected(reason.error());
  }
  return error_response{ std::move(error_code.value()), std::move(reason.value()) };
}

auto
classify_response(request_intent intent, const http_exchange& exchange)
  -> tl::expected<tao::json::value, error>
{
  if (auto failure = classify_status(intent, exchange); failure) {
    log_failure(intent, exchange, failure.value());
    return tl::unexpected(std::move(failure.value()));
  }
  auto body = parse_json_body(exchange);
  if (!body) {
    log_failure(intent, exchange, body.error());
  }
  return body;
}

auto
classify_raw_response(request_intent intent, const http_exchange& exchange)
  -> tl::expected<std::string, error>
{
  if (auto failure = classify_status(intent, exchange); failure) {
    log_failure(intent, exchange, failure.value());
    return tl::unexpected(std::move(failure.value()));
  }
  return exchange.body;
}
} // namespace couchrest
