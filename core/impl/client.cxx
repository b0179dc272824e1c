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

#include <couchrest/client.hxx>

#include <couchrest/fmt/error.hxx>
#include <couchrest/fmt/request_intent.hxx>

#include "core/design_json.hxx"
#include "core/logger/logger.hxx"
#include "core/meta/version.hxx"
#include "core/utils/join_strings.hxx"
#include "core/utils/json.hxx"
#include "core/utils/url_codec.hxx"

#include <tao/json.hpp>

#include <fmt/core.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace couchrest
{
namespace
{
auto
encode_body(const tao::json::value& content) -> tl::expected<std::string, error>
{
  try {
    return core::utils::json::generate(content);
  } catch (const std::runtime_error& e) {
    return tl::unexpected(errors::json_encode{ e.what() });
  }
}

auto
encode_document(const tao::json::value& content, const std::optional<revision>& rev)
  -> tl::expected<std::string, error>
{
  if (!content.is_object()) {
    return tl::unexpected(errors::json_encode{ "document content must be a JSON object" });
  }
  if (!rev) {
    return encode_body(content);
  }
  auto body = content;
  body["_rev"] = rev->to_string();
  return encode_body(body);
}

auto
revision_query(const std::optional<revision>& rev) -> std::string
{
  if (!rev) {
    return {};
  }
  return fmt::format("rev={}", core::utils::string_codec::v2::query_escape(rev->to_string()));
}

auto
encode_view_query(const view_query_options& options) -> std::vector<std::string>
{
  using core::utils::string_codec::v2::query_escape;

  std::vector<std::string> query_string{};
  if (options.key) {
    query_string.emplace_back(fmt::format("key={}", query_escape(options.key.value())));
  }
  if (options.start_key) {
    query_string.emplace_back(fmt::format("start_key={}", query_escape(options.start_key.value())));
  }
  if (options.end_key) {
    query_string.emplace_back(fmt::format("end_key={}", query_escape(options.end_key.value())));
  }
  if (options.start_key_doc_id) {
    query_string.emplace_back(
      fmt::format("start_key_doc_id={}", query_escape(options.start_key_doc_id.value())));
  }
  if (options.end_key_doc_id) {
    query_string.emplace_back(
      fmt::format("end_key_doc_id={}", query_escape(options.end_key_doc_id.value())));
  }
  if (options.inclusive_end) {
    query_string.emplace_back(
      fmt::format("inclusive_end={}", options.inclusive_end.value() ? "true" : "false"));
  }
  if (options.reduce) {
    query_string.emplace_back(fmt::format("reduce={}", options.reduce.value() ? "true" : "false"));
  }
  if (options.group) {
    query_string.emplace_back(fmt::format("group={}", options.group.value() ? "true" : "false"));
  }
  if (options.group_level) {
    query_string.emplace_back(fmt::format("group_level={}", options.group_level.value()));
  }
  if (options.include_docs) {
    query_string.emplace_back(
      fmt::format("include_docs={}", options.include_docs.value() ? "true" : "false"));
  }
  if (options.limit) {
    query_string.emplace_back(fmt::format("limit={}", options.limit.value()));
  }
  if (options.skip) {
    query_string.emplace_back(fmt::format("skip={}", options.skip.value()));
  }
  if (options.order) {
    switch (options.order.value()) {
      case view_sort_order::descending:
        query_string.emplace_back("descending=true");
        break;
      case view_sort_order::ascending:
        query_string.emplace_back("descending=false");
        break;
    }
  }
  for (const auto& [name, value] : options.raw) {
    query_string.emplace_back(fmt::format("{}={}", name, value));
  }
  return query_string;
}

auto
encode_view_keys(const std::vector<std::string>& keys) -> tl::expected<std::string, error>
{
  tao::json::value keys_array = tao::json::empty_array;
  for (const auto& entry : keys) {
    try {
      keys_array.push_back(core::utils::json::parse(entry));
    } catch (const tao::pegtl::parse_error& e) {
      return tl::unexpected(errors::json_encode{ fmt::format("view key is not JSON: {}", e.what()) });
    }
  }
  return encode_body(tao::json::value{ { "keys", keys_array } });
}
} // namespace

client::client(server_url url, std::shared_ptr<transport> transport)
  : url_{ std::move(url) }
  , transport_{ std::move(transport) }
{
  for (const auto& warning : url_.warnings) {
    CR_LOG_WARNING("{}", warning);
  }
}

auto
client::make_request(std::string method, const std::string& path) const -> http_request
{
  http_request request{};
  request.method = std::move(method);
  request.path = url_.request_path(path);
  request.timeout = url_.options.timeout;
  request.max_body_size = url_.options.max_body_size;
  request.headers["accept"] = "application/json";
  request.headers["user-agent"] = core::meta::user_agent_for_http(url_.options.user_agent_extra);
  return request;
}

auto
client::send(request_intent intent, const http_request& request) const
  -> tl::expected<http_exchange, error>
{
  if (transport_ == nullptr) {
    return tl::unexpected(errors::transport{ std::make_error_code(std::errc::not_connected),
                                             "No transport configured" });
  }
  CR_LOG_TRACE("{} {} {}{}{}",
               intent,
               request.method,
               request.path,
               request.query.empty() ? "" : "?",
               request.query);
  auto exchange = transport_->send(request);
  if (!exchange) {
    error failure{ exchange.error() };
    CR_LOG_DEBUG("{} {} {} failed: {}", intent, request.method, request.path, failure);
    return tl::unexpected(std::move(failure));
  }
  if (request.max_body_size > 0 && exchange->body.size() > request.max_body_size) {
    CR_LOG_DEBUG("{} {} {} returned {} bytes, limit is {}",
                 intent,
                 request.method,
                 request.path,
                 exchange->body.size(),
                 request.max_body_size);
    return tl::unexpected(
      errors::transport{ std::make_error_code(std::errc::message_size),
                         fmt::format("Response body exceeds the limit of {} bytes",
                                     request.max_body_size) });
  }
  CR_LOG_TRACE("{} {} {} completed with status {}",
               intent,
               request.method,
               request.path,
               exchange->status_code);
  return std::move(exchange.value());
}

auto
client::execute(request_intent intent, const http_request& request) const
  -> tl::expected<tao::json::value, error>
{
  auto exchange = send(intent, request);
  if (!exchange) {
    return tl::unexpected(exchange.error());
  }
  return classify_response(intent, exchange.value());
}

auto
client::write(const http_request& request) const -> tl::expected<write_result, error>
{
  auto body = execute(request_intent::document_write, request);
  if (!body) {
    return tl::unexpected(body.error());
  }
  return core::decode_write_result(body.value());
}

auto
client::create_database(const database_path& path) const -> tl::expected<void, error>
{
  auto body = execute(request_intent::create_database, make_request("PUT", path.to_string()));
  if (!body) {
    return tl::unexpected(body.error());
  }
  return {};
}

auto
client::delete_database(const database_path& path) const -> tl::expected<void, error>
{
  auto body = execute(request_intent::delete_database, make_request("DELETE", path.to_string()));
  if (!body) {
    return tl::unexpected(body.error());
  }
  return {};
}

auto
client::create_document(const database_path& path, const tao::json::value& content) const
  -> tl::expected<write_result, error>
{
  auto body = encode_document(content, {});
  if (!body) {
    return tl::unexpected(body.error());
  }
  auto request = make_request("POST", path.to_string());
  request.headers["content-type"] = "application/json";
  request.body = std::move(body.value());
  return write(request);
}

auto
client::create_document(const document_path& path, const tao::json::value& content) const
  -> tl::expected<write_result, error>
{
  auto body = encode_document(content, {});
  if (!body) {
    return tl::unexpected(body.error());
  }
  auto request = make_request("PUT", path.to_string());
  request.headers["content-type"] = "application/json";
  request.body = std::move(body.value());
  return write(request);
}

auto
client::read_document(const document_path& path, const std::optional<revision>& rev) const
  -> tl::expected<document, error>
{
  auto request = make_request("GET", path.to_string());
  request.query = revision_query(rev);
  auto body = execute(request_intent::lookup, request);
  if (!body) {
    return tl::unexpected(body.error());
  }
  return core::decode_document(body.value());
}

auto
client::update_document(const document_path& path,
                        const revision& rev,
                        const tao::json::value& content) const -> tl::expected<write_result, error>
{
  auto body = encode_document(content, rev);
  if (!body) {
    return tl::unexpected(body.error());
  }
  auto request = make_request("PUT", path.to_string());
  request.headers["content-type"] = "application/json";
  request.body = std::move(body.value());
  return write(request);
}

auto
client::delete_document(const document_path& path, const revision& rev) const
  -> tl::expected<write_result, error>
{
  auto request = make_request("DELETE", path.to_string());
  request.query = revision_query(rev);
  return write(request);
}

auto
client::read_attachment(const attachment_path& path, const std::optional<revision>& rev) const
  -> tl::expected<std::string, error>
{
  auto request = make_request("GET", path.to_string());
  request.headers.erase("accept");
  request.query = revision_query(rev);
  auto exchange = send(request_intent::lookup, request);
  if (!exchange) {
    return tl::unexpected(exchange.error());
  }
  return classify_raw_response(request_intent::lookup, exchange.value());
}

auto
client::read_design(const design_document_path& path) const -> tl::expected<design, error>
{
  auto body = execute(request_intent::lookup, make_request("GET", path.to_string()));
  if (!body) {
    return tl::unexpected(body.error());
  }
  return core::decode_design(body.value());
}

auto
client::write_design(const design_document_path& path,
                     const design& content,
                     const std::optional<revision>& rev) const -> tl::expected<write_result, error>
{
  auto body = encode_document(tao::json::value(content), rev);
  if (!body) {
    return tl::unexpected(body.error());
  }
  auto request = make_request("PUT", path.to_string());
  request.headers["content-type"] = "application/json";
  request.body = std::move(body.value());
  return write(request);
}

auto
client::execute_view(const view_path& path, const view_query_options& options) const
  -> tl::expected<view_result, error>
{
  auto request = make_request(options.keys.empty() ? "GET" : "POST", path.to_string());
  request.query = core::utils::join_strings(encode_view_query(options), "&");
  if (!options.keys.empty()) {
    auto keys = encode_view_keys(options.keys);
    if (!keys) {
      return tl::unexpected(keys.error());
    }
    request.headers["content-type"] = "application/json";
    request.body = std::move(keys.value());
  }
  auto body = execute(request_intent::view_query, request);
  if (!body) {
    return tl::unexpected(body.error());
  }
  return core::decode_view_result(body.value());
}
} // namespace couchrest
