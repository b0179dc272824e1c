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
#include <couchrest/error.hxx>
#include <couchrest/payloads.hxx>
#include <couchrest/resource_path.hxx>
#include <couchrest/response_classifier.hxx>
#include <couchrest/revision.hxx>
#include <couchrest/server_url.hxx>
#include <couchrest/transport.hxx>
#include <couchrest/view_query_options.hxx>

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <string>

namespace couchrest
{
/**
 * Synchronous client of the database REST API.
 *
 * Every operation builds the request from the resource path, sends it through the transport and
 * classifies the response. The client never retries, the caller decides what to do with the
 * returned error.
 *
 * The client holds no mutable state, so it can be shared between threads if the transport can.
 *
 * @since 1.0.0
 * @committed
 */
class client
{
public:
  client(server_url url, std::shared_ptr<transport> transport);

  [[nodiscard]] auto url() const -> const server_url&
  {
    return url_;
  }

  /**
   * @return @ref errors::database_exists if the database already exists
   */
  [[nodiscard]] auto create_database(const database_path& path) const -> tl::expected<void, error>;

  [[nodiscard]] auto delete_database(const database_path& path) const -> tl::expected<void, error>;

  /**
   * Creates the document with the server-generated id.
   *
   * @param content JSON object
   */
  [[nodiscard]] auto create_document(const database_path& path,
                                     const tao::json::value& content) const
    -> tl::expected<write_result, error>;

  /**
   * Creates the document with the given id.
   *
   * @return @ref errors::document_conflict if the document already exists
   */
  [[nodiscard]] auto create_document(const document_path& path,
                                     const tao::json::value& content) const
    -> tl::expected<write_result, error>;

  /**
   * @param rev the revision to read, the latest one if not set
   */
  [[nodiscard]] auto read_document(const document_path& path,
                                   const std::optional<revision>& rev = {}) const
    -> tl::expected<document, error>;

  /**
   * @return @ref errors::document_conflict if the rev is not the latest revision
   */
  [[nodiscard]] auto update_document(const document_path& path,
                                     const revision& rev,
                                     const tao::json::value& content) const
    -> tl::expected<write_result, error>;

  [[nodiscard]] auto delete_document(const document_path& path, const revision& rev) const
    -> tl::expected<write_result, error>;

  /**
   * @return the attachment content as is
   */
  [[nodiscard]] auto read_attachment(const attachment_path& path,
                                     const std::optional<revision>& rev = {}) const
    -> tl::expected<std::string, error>;

  [[nodiscard]] auto read_design(const design_document_path& path) const
    -> tl::expected<design, error>;

  /**
   * Creates the design document, or replaces it if the revision is given.
   */
  [[nodiscard]] auto write_design(const design_document_path& path,
                                  const design& content,
                                  const std::optional<revision>& rev = {}) const
    -> tl::expected<write_result, error>;

  [[nodiscard]] auto execute_view(const view_path& path,
                                  const view_query_options& options = {}) const
    -> tl::expected<view_result, error>;

private:
  [[nodiscard]] auto make_request(std::string method, const std::string& path) const
    -> http_request;

  [[nodiscard]] auto send(request_intent intent, const http_request& request) const
    -> tl::expected<http_exchange, error>;

  [[nodiscard]] auto execute(request_intent intent, const http_request& request) const
    -> tl::expected<tao::json::value, error>;

  [[nodiscard]] auto write(const http_request& request) const -> tl::expected<write_result, error>;

  server_url url_;
  std::shared_ptr<transport> transport_;
};
} // namespace couchrest
