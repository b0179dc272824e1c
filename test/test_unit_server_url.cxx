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

#include "test_helper.hxx"

#include <couchrest/server_url.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>

using namespace std::chrono_literals;

TEST_CASE("unit: server URL", "[unit]")
{
    SECTION("host only")
    {
        auto url = couchrest::parse_server_url("http://localhost");
        EXPECT_SUCCESS(url);
        CHECK(url->scheme == "http");
        CHECK_FALSE(url->tls);
        CHECK(url->host == "localhost");
        CHECK(url->port == 5984);
        CHECK(url->path_prefix.empty());
        CHECK(url->warnings.empty());
        CHECK(url->options.timeout == couchrest::timeout_defaults::request_timeout);
        CHECK(url->base() == "http://localhost:5984");
        CHECK(url->request_path("/alpha") == "/alpha");
    }

    SECTION("default TLS port")
    {
        auto url = couchrest::parse_server_url("https://db.example.com");
        EXPECT_SUCCESS(url);
        CHECK(url->tls);
        CHECK(url->port == 6984);
    }

    SECTION("scheme is case-insensitive")
    {
        auto url = couchrest::parse_server_url("HTTPS://db.example.com");
        EXPECT_SUCCESS(url);
        CHECK(url->scheme == "https");
        CHECK(url->tls);
    }

    SECTION("explicit port")
    {
        auto url = couchrest::parse_server_url("http://127.0.0.1:15984");
        EXPECT_SUCCESS(url);
        CHECK(url->host == "127.0.0.1");
        CHECK(url->port == 15984);
    }

    SECTION("IPv6 literal")
    {
        auto url = couchrest::parse_server_url("http://[::1]:5985");
        EXPECT_SUCCESS(url);
        CHECK(url->host == "[::1]");
        CHECK(url->port == 5985);
    }

    SECTION("path prefix")
    {
        auto url = couchrest::parse_server_url("https://example.com/couchdb/");
        EXPECT_SUCCESS(url);
        CHECK(url->path_prefix == "/couchdb");
        CHECK(url->base() == "https://example.com:6984/couchdb");
        CHECK(url->request_path("/alpha/bravo") == "/couchdb/alpha/bravo");
    }
}

TEST_CASE("unit: server URL options", "[unit]")
{
    SECTION("all known options")
    {
        auto url = couchrest::parse_server_url("http://localhost:5984/?timeout=2.5s&user_agent_extra=my%20app%2F1.0&max_body_size=1048576");
        EXPECT_SUCCESS(url);
        CHECK(url->warnings.empty());
        CHECK(url->params.size() == 3);
        CHECK(url->options.timeout == 2500ms);
        CHECK(url->options.user_agent_extra == "my app/1.0");
        CHECK(url->options.max_body_size == 1'048'576);
    }

    SECTION("timeout as plain milliseconds")
    {
        auto url = couchrest::parse_server_url("http://localhost?timeout=1500");
        EXPECT_SUCCESS(url);
        CHECK(url->options.timeout == 1500ms);
    }

    SECTION("options passed by the caller are defaults")
    {
        couchrest::client_options options{};
        options.timeout = 3s;
        options.user_agent_extra = "caller";
        auto url = couchrest::parse_server_url("http://localhost?max_body_size=10", options);
        EXPECT_SUCCESS(url);
        CHECK(url->options.timeout == 3s);
        CHECK(url->options.user_agent_extra == "caller");
        CHECK(url->options.max_body_size == 10);
    }

    SECTION("malformed values produce warnings")
    {
        auto url = couchrest::parse_server_url("http://localhost?timeout=soon&max_body_size=big");
        EXPECT_SUCCESS(url);
        REQUIRE(url->warnings.size() == 2);
        CHECK(url->options.timeout == couchrest::timeout_defaults::request_timeout);
        CHECK(url->options.max_body_size == 0);
        CHECK_THAT(url->warnings[0], Catch::Matchers::ContainsSubstring(R"("max_body_size")"));
    }

    SECTION("out of range value")
    {
        auto url = couchrest::parse_server_url("http://localhost?max_body_size=99999999999999999999999");
        EXPECT_SUCCESS(url);
        REQUIRE(url->warnings.size() == 1);
        CHECK_THAT(url->warnings[0], Catch::Matchers::ContainsSubstring("out of range"));
    }

    SECTION("unknown parameter")
    {
        auto url = couchrest::parse_server_url("http://localhost?compression=true");
        EXPECT_SUCCESS(url);
        REQUIRE(url->warnings.size() == 1);
        CHECK(url->warnings[0] == R"(unknown parameter "compression" in server URL (value "true"))");
    }
}

TEST_CASE("unit: invalid server URL", "[unit]")
{
    SECTION("not scheme relative")
    {
        for (const auto* input : { "mailto:admin@example.com", "localhost:5984", "http:localhost" }) {
            INFO(input);
            auto url = couchrest::parse_server_url(input);
            EXPECT_FAILURE(url, couchrest::errors::url_not_scheme_relative);
        }
    }

    SECTION("empty input")
    {
        auto url = couchrest::parse_server_url("");
        EXPECT_FAILURE(url, couchrest::errors::url_parse);
        CHECK(url.error().message() == "The URL is badly formatted: empty input");
    }

    SECTION("relative URL")
    {
        auto url = couchrest::parse_server_url("//localhost:5984");
        EXPECT_FAILURE(url, couchrest::errors::url_parse);
        CHECK(url.error().cause() == "relative URL without a base");
    }

    SECTION("unsupported scheme")
    {
        auto url = couchrest::parse_server_url("ftp://localhost");
        EXPECT_FAILURE(url, couchrest::errors::url_parse);
        CHECK(url.error().cause() == R"(unsupported scheme "ftp")");
    }

    SECTION("invalid port")
    {
        for (const auto* input : { "http://localhost:0", "http://localhost:65536", "http://localhost:99999999999" }) {
            INFO(input);
            auto url = couchrest::parse_server_url(input);
            EXPECT_FAILURE(url, couchrest::errors::url_parse);
        }
    }

    SECTION("grammar failure reports the position")
    {
        auto url = couchrest::parse_server_url("http://local host");
        EXPECT_FAILURE(url, couchrest::errors::url_parse);
        CHECK_THAT(url.error().message(), Catch::Matchers::ContainsSubstring(R"(trailer: " host")"));
    }
}
