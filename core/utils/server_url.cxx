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

#include <couchrest/server_url.hxx>

#include "duration_parser.hxx"
#include "url_codec.hxx"

#include <fmt/core.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/uri.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace couchrest
{
namespace priv
{
using namespace tao::pegtl;

struct scheme : uri::scheme {
};
using scheme_head = seq<scheme, one<':'>>;

struct reg_name : plus<sor<uri::unreserved, uri::pct_encoded, uri::sub_delims>> {
};
struct host : sor<uri::IP_literal, uri::IPv4address, reg_name> {
};
struct port : plus<abnf::DIGIT> {
};
struct path_prefix : star<one<'/'>, star<uri::pchar>> {
};

using param_key = plus<sor<abnf::ALPHA, abnf::DIGIT, one<'_'>>>;
using param_value = star<sor<minus<uri::pchar, one<'=', '&', '?'>>, one<'/'>>>;
struct param : seq<param_key, one<'='>, param_value> {
};
using opt_params = opt_must<one<'?'>, list_must<param, one<'&'>>>;

using grammar = must<
  seq<scheme_head, uri::dslash, host, opt<one<':'>, port>, path_prefix, opt_params, eof>>;

template<typename Rule>
struct action {
};

template<>
struct action<scheme> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, server_url& url)
  {
    url.scheme = in.string();
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    url.tls = url.scheme == "https";
    url.port = url.tls ? 6984 : 5984;
  }
};

template<>
struct action<host> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, server_url& url)
  {
    url.host = in.string();
  }
};

template<>
struct action<port> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, server_url& url)
  {
    std::uint32_t value{};
    auto text = in.string_view();
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || value == 0 || value > std::numeric_limits<std::uint16_t>::max()) {
      throw parse_error(fmt::format(R"(invalid port "{}")", text), in);
    }
    url.port = static_cast<std::uint16_t>(value);
  }
};

template<>
struct action<path_prefix> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, server_url& url)
  {
    auto prefix = in.string();
    while (!prefix.empty() && prefix.back() == '/') {
      prefix.pop_back();
    }
    url.path_prefix = prefix;
  }
};

template<>
struct action<param> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, server_url& url)
  {
    const auto& pair = in.string();
    auto eq = pair.find('=');
    url.params[pair.substr(0, eq)] = (eq == std::string::npos) ? "" : pair.substr(eq + 1);
  }
};
} // namespace priv

namespace
{
void
parse_option(std::string& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  if (auto decoded = core::utils::string_codec::query_unescape(value); decoded) {
    receiver = decoded.value();
  } else {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in server URL (value "{}" has invalid percent-encoding))",
      name,
      value));
  }
}

void
parse_option(std::size_t& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  std::size_t parsed{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed, 10);
  if (ec == std::errc::result_out_of_range) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in server URL (value "{}" is out of range))", name, value));
  } else if (ec != std::errc{} || ptr != value.data() + value.size()) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in server URL (value "{}" is not a number))", name, value));
  } else {
    receiver = parsed;
  }
}

void
parse_option(std::chrono::milliseconds& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  try {
    receiver =
      std::chrono::duration_cast<std::chrono::milliseconds>(core::utils::parse_duration(value));
    return;
  } catch (const core::utils::duration_parse_error&) {
    // plain number of milliseconds is also accepted
  }
  std::size_t millis{ 0 };
  std::vector<std::string> number_warnings{};
  parse_option(millis, name, value, number_warnings);
  if (number_warnings.empty()) {
    receiver = std::chrono::milliseconds(millis);
    return;
  }
  warnings.push_back(fmt::format(
    R"(unable to parse "{}" parameter in server URL (value "{}" is neither duration nor number))",
    name,
    value));
}

void
extract_options(server_url& url)
{
  for (const auto& [name, value] : url.params) {
    if (name == "timeout") {
      parse_option(url.options.timeout, name, value, url.warnings);
    } else if (name == "user_agent_extra") {
      parse_option(url.options.user_agent_extra, name, value, url.warnings);
    } else if (name == "max_body_size") {
      parse_option(url.options.max_body_size, name, value, url.warnings);
    } else {
      url.warnings.push_back(
        fmt::format(R"(unknown parameter "{}" in server URL (value "{}"))", name, value));
    }
  }
}

auto
has_scheme_relative_authority(const std::string& input, std::size_t scheme_length) -> bool
{
  // scheme_length includes the colon
  return input.compare(scheme_length, 2, "//") == 0;
}
} // namespace

auto
server_url::base() const -> std::string
{
  return fmt::format("{}://{}:{}{}", scheme, host, port, path_prefix);
}

auto
server_url::request_path(const std::string& path) const -> std::string
{
  return path_prefix + path;
}

auto
parse_server_url(const std::string& input, client_options options)
  -> tl::expected<server_url, error>
{
  if (input.empty()) {
    return tl::unexpected(errors::url_parse{ "empty input" });
  }

  {
    auto head = tao::pegtl::memory_input(input, __FUNCTION__);
    if (!tao::pegtl::parse<priv::scheme_head>(head)) {
      return tl::unexpected(errors::url_parse{ "relative URL without a base" });
    }
    auto scheme_length = static_cast<std::size_t>(head.current() - input.data());
    if (!has_scheme_relative_authority(input, scheme_length)) {
      return tl::unexpected(errors::url_not_scheme_relative{});
    }
  }

  server_url url{};
  url.options = std::move(options);
  auto in = tao::pegtl::memory_input(input, __FUNCTION__);
  try {
    tao::pegtl::parse<priv::grammar, priv::action>(in, url);
  } catch (const tao::pegtl::parse_error& e) {
    for (const auto& position : e.positions()) {
      if (position.source == __FUNCTION__) {
        return tl::unexpected(errors::url_parse{
          fmt::format("failed to parse server URL (column: {}, trailer: \"{}\")",
                      position.column,
                      input.substr(position.byte)) });
      }
    }
    return tl::unexpected(errors::url_parse{ e.what() });
  }

  if (url.scheme != "http" && url.scheme != "https") {
    return tl::unexpected(errors::url_parse{ fmt::format(R"(unsupported scheme "{}")", url.scheme) });
  }

  extract_options(url);
  return url;
}
} // namespace couchrest
