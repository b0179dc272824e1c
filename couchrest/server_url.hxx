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

#include <couchrest/client_options.hxx>
#include <couchrest/error.hxx>

#include <tl/expected.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace couchrest
{
/**
 * Location of the server and client options, as parsed from the URL like
 * "https://db.example.com:6984/couch?timeout=10s".
 *
 * @since 1.0.0
 * @committed
 */
struct server_url {
  std::string scheme{ "http" };
  bool tls{ false };
  std::string host{};
  std::uint16_t port{ 5984 };

  /**
   * Path where the server is mounted (for example behind reverse proxy), without trailing slash.
   * Empty when the server is at the root.
   */
  std::string path_prefix{};

  std::map<std::string, std::string> params{};
  client_options options{};

  /**
   * Problems with the query parameters. They do not fail the parsing.
   */
  std::vector<std::string> warnings{};

  /**
   * @return "scheme://host:port" followed by the path prefix
   */
  [[nodiscard]] auto base() const -> std::string;

  /**
   * @param path rendered resource path, starting with "/"
   * @return path with the prefix prepended, suitable for the request line
   */
  [[nodiscard]] auto request_path(const std::string& path) const -> std::string;
};

/**
 * Parses base URL of the server.
 *
 * Recognized query parameters: "timeout" (duration like "10s", or number of milliseconds),
 * "user_agent_extra" and "max_body_size" (bytes).
 *
 * @return the parsed URL, @ref errors::url_not_scheme_relative if the URL has no "//" authority,
 * or @ref errors::url_parse for any other malformed input
 */
auto
parse_server_url(const std::string& input, client_options options = {})
  -> tl::expected<server_url, error>;
} // namespace couchrest
