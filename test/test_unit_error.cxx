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

#include <couchrest/error.hxx>
#include <couchrest/fmt/error.hxx>

#include <fmt/core.h>

#include <string>
#include <system_error>

TEST_CASE("unit: error descriptions", "[unit]")
{
    couchrest::error_response response{ "not_found", "deleted" };

    CHECK(couchrest::error{ couchrest::errors::not_found{ response } }.message() == "The resource cannot be found: not_found: deleted");
    CHECK(couchrest::error{ couchrest::errors::unauthorized{ response } }.description() == "The client has insufficient privilege");
    CHECK(couchrest::error{ couchrest::errors::document_is_deleted{} }.message() == "The document is deleted");
    CHECK(couchrest::error{ couchrest::errors::url_not_scheme_relative{} }.message() == "The URL is not scheme relative");
    CHECK(couchrest::error{ couchrest::errors::url_parse{ "empty input" } }.message() == "The URL is badly formatted: empty input");
    CHECK(couchrest::error{ couchrest::errors::json_encode{ "NaN" } }.message() == "An error occurred while encoding JSON: NaN");
    CHECK(couchrest::error{ couchrest::errors::unexpected_response{ R"(missing string field "id")" } }.message() ==
          R"(The server responded unexpectedly: missing string field "id")");
}

TEST_CASE("unit: error cause", "[unit]")
{
    SECTION("transport failure embeds the cause")
    {
        couchrest::error err = couchrest::errors::transport{ std::make_error_code(std::errc::connection_refused) };
        CHECK(err.description() == "An HTTP transport error occurred");
        REQUIRE(err.cause().has_value());
        CHECK(err.cause().value() == std::make_error_code(std::errc::connection_refused).message());
        CHECK(err.message() ==
              fmt::format("An HTTP transport error occurred: {}", std::make_error_code(std::errc::connection_refused).message()));
    }

    SECTION("transport failure with custom description")
    {
        couchrest::error err = couchrest::errors::transport{ std::make_error_code(std::errc::timed_out), "Request timed out" };
        CHECK(err.description() == "Request timed out");
    }

    SECTION("I/O failure")
    {
        couchrest::error err = couchrest::errors::io{ std::make_error_code(std::errc::broken_pipe) };
        CHECK(err.description() == "An I/O error occurred");
        CHECK(err.cause().has_value());
    }

    SECTION("revision parse failure")
    {
        couchrest::error with_cause =
          couchrest::errors::revision_parse{ couchrest::errc::revision_parse::number_parse, std::make_error_code(std::errc::invalid_argument) };
        REQUIRE(with_cause.cause().has_value());
        CHECK(with_cause.message() ==
              fmt::format("The revision is badly formatted: The number part is invalid: {}",
                          std::make_error_code(std::errc::invalid_argument).message()));

        couchrest::error without_cause = couchrest::errors::revision_parse{ couchrest::errc::revision_parse::digest_not_all_hex };
        CHECK_FALSE(without_cause.cause().has_value());
    }

    SECTION("server failures have no cause")
    {
        couchrest::error err = couchrest::errors::database_exists{ { "file_exists", "exists" } };
        CHECK_FALSE(err.cause().has_value());
    }
}

TEST_CASE("unit: error inspection", "[unit]")
{
    couchrest::error err = couchrest::errors::document_conflict{ { "conflict", "Document update conflict." } };

    CHECK(err.is<couchrest::errors::document_conflict>());
    CHECK_FALSE(err.is<couchrest::errors::not_found>());
    CHECK(err.get_if<couchrest::errors::not_found>() == nullptr);
    REQUIRE(err.get_if<couchrest::errors::document_conflict>() != nullptr);
    REQUIRE(err.server_error() != nullptr);
    CHECK(err.server_error()->error() == "conflict");

    auto status = err.visit([](const auto& kind) -> std::uint32_t {
        using kind_type = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<kind_type, couchrest::errors::document_conflict>) {
            return 409;
        } else {
            return 0;
        }
    });
    CHECK(status == 409);
}

TEST_CASE("unit: server response message", "[unit]")
{
    SECTION("known status with body")
    {
        couchrest::error err = couchrest::errors::server_response{ 400, couchrest::error_response{ "bad_request", "Invalid rev format" } };
        CHECK(err.message() == "The server responded with an error (400: Bad Request): bad_request: Invalid rev format");
    }

    SECTION("unknown status")
    {
        couchrest::error err = couchrest::errors::server_response{ 599 };
        CHECK(err.message() == "The server responded with an error (599)");
    }

    SECTION("reason phrases")
    {
        CHECK(couchrest::status_reason_phrase(412) == "Precondition Failed");
        CHECK(couchrest::status_reason_phrase(499).empty());
    }
}

TEST_CASE("unit: error formatting", "[unit]")
{
    couchrest::error err = couchrest::errors::not_found{ { "not_found", "missing" } };
    CHECK(fmt::format("{}", err) == err.message());
    CHECK(fmt::format("{}", couchrest::error_response{ "not_found", "missing" }) == "not_found: missing");
}

TEST_CASE("unit: error response ordering", "[unit]")
{
    couchrest::error_response a{ "a", "z" };
    couchrest::error_response b{ "b", "a" };
    couchrest::error_response c{ "b", "b" };
    CHECK(a < b);
    CHECK(b < c);
    CHECK(a != b);
    CHECK(c == couchrest::error_response{ "b", "b" });
}
