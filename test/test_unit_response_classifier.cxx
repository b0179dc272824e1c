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

#include <catch2/matchers/catch_matchers_string.hpp>

#include "test/utils/logger.hxx"

#include <couchrest/fmt/request_intent.hxx>
#include <couchrest/response_classifier.hxx>

#include <tao/json.hpp>

namespace
{
auto
json_exchange(std::uint32_t status_code, std::string body) -> couchrest::http_exchange
{
    couchrest::http_exchange exchange{};
    exchange.status_code = status_code;
    exchange.content_type = "application/json";
    exchange.body = std::move(body);
    return exchange;
}

const std::string file_exists_body{ R"({"error":"file_exists","reason":"The database could not be created, the file already exists."})" };
} // namespace

TEST_CASE("unit: JSON content type detection", "[unit]")
{
    CHECK(couchrest::is_json_content_type("application/json"));
    CHECK(couchrest::is_json_content_type("application/json; charset=utf-8"));
    CHECK(couchrest::is_json_content_type("Application/JSON"));
    CHECK(couchrest::is_json_content_type(" application/json ;charset=utf-8"));
    CHECK_FALSE(couchrest::is_json_content_type("text/plain"));
    CHECK_FALSE(couchrest::is_json_content_type("application/jsonp"));
    CHECK_FALSE(couchrest::is_json_content_type("text/json"));
    CHECK_FALSE(couchrest::is_json_content_type(""));
}

TEST_CASE("unit: decode error response", "[unit]")
{
    SECTION("well-formed body")
    {
        auto response = couchrest::decode_error_response(json_exchange(412, file_exists_body));
        EXPECT_SUCCESS(response);
        CHECK(response->error() == "file_exists");
        CHECK(response->reason() == "The database could not be created, the file already exists.");
    }

    SECTION("unknown fields are rejected")
    {
        auto response = couchrest::decode_error_response(json_exchange(400, R"({"error":"bad_request","reason":"x","extra":1})"));
        EXPECT_FAILURE(response, couchrest::errors::json_decode);
        CHECK_THAT(response.error().message(), Catch::Matchers::ContainsSubstring("extra"));
    }

    SECTION("missing reason")
    {
        auto response = couchrest::decode_error_response(json_exchange(400, R"({"error":"bad_request"})"));
        EXPECT_FAILURE(response, couchrest::errors::json_decode);
    }

    SECTION("wrong field type")
    {
        auto response = couchrest::decode_error_response(json_exchange(400, R"({"error":42,"reason":"x"})"));
        EXPECT_FAILURE(response, couchrest::errors::json_decode);
    }

    SECTION("not an object")
    {
        auto response = couchrest::decode_error_response(json_exchange(400, R"(["error","reason"])"));
        EXPECT_FAILURE(response, couchrest::errors::json_decode);
    }

    SECTION("malformed JSON")
    {
        auto response = couchrest::decode_error_response(json_exchange(400, R"({"error":)"));
        EXPECT_FAILURE(response, couchrest::errors::json_decode);
    }

    SECTION("not JSON")
    {
        couchrest::http_exchange exchange{ 500, "text/html", "<html></html>", {} };
        auto response = couchrest::decode_error_response(exchange);
        EXPECT_FAILURE(response, couchrest::errors::response_not_json);
        CHECK(response.error().get_if<couchrest::errors::response_not_json>()->content_type == "text/html");
    }
}

TEST_CASE("unit: classify successful responses", "[unit]")
{
    test::utils::init_logger();

    SECTION("JSON body is decoded")
    {
        auto body = couchrest::classify_response(couchrest::request_intent::lookup, json_exchange(200, R"({"ok":true})"));
        EXPECT_SUCCESS(body);
        CHECK(body->at("ok").get_boolean());
    }

    SECTION("any 2xx status is a success")
    {
        auto body = couchrest::classify_response(couchrest::request_intent::create_database, json_exchange(201, R"({"ok":true})"));
        EXPECT_SUCCESS(body);
        body = couchrest::classify_response(couchrest::request_intent::document_write, json_exchange(202, R"({"ok":true})"));
        EXPECT_SUCCESS(body);
    }

    SECTION("missing content type")
    {
        couchrest::http_exchange exchange{ 200, {}, R"({"ok":true})", {} };
        auto body = couchrest::classify_response(couchrest::request_intent::lookup, exchange);
        EXPECT_FAILURE(body, couchrest::errors::response_not_json);
        CHECK_FALSE(body.error().get_if<couchrest::errors::response_not_json>()->content_type.has_value());
        CHECK(body.error().message() == "The response content has no type");
    }

    SECTION("non-JSON content type")
    {
        couchrest::http_exchange exchange{ 200, "text/plain", "ok", {} };
        auto body = couchrest::classify_response(couchrest::request_intent::lookup, exchange);
        EXPECT_FAILURE(body, couchrest::errors::response_not_json);
        CHECK(body.error().message() == "The response has non-JSON content: Content type is text/plain");
    }

    SECTION("malformed JSON")
    {
        auto body = couchrest::classify_response(couchrest::request_intent::lookup, json_exchange(200, "{"));
        EXPECT_FAILURE(body, couchrest::errors::json_decode);
    }

    SECTION("raw body skips content type check")
    {
        couchrest::http_exchange exchange{ 200, "image/png", std::string("\x89PNG\r\n", 6), {} };
        auto body = couchrest::classify_raw_response(couchrest::request_intent::lookup, exchange);
        EXPECT_SUCCESS(body);
        CHECK(body.value() == std::string("\x89PNG\r\n", 6));
    }
}

TEST_CASE("unit: classify server failures", "[unit]")
{
    using couchrest::request_intent;

    test::utils::init_logger();

    SECTION("existing database")
    {
        for (auto status : { 409U, 412U }) {
            INFO(status);
            auto body = couchrest::classify_response(request_intent::create_database, json_exchange(status, file_exists_body));
            EXPECT_FAILURE(body, couchrest::errors::database_exists);
            CHECK(body.error().server_error()->error() == "file_exists");
            CHECK(body.error().message() ==
                  "The database already exists: file_exists: The database could not be created, the file already exists.");
        }
    }

    SECTION("document conflict")
    {
        auto body = couchrest::classify_response(request_intent::document_write,
                                                 json_exchange(409, R"({"error":"conflict","reason":"Document update conflict."})"));
        EXPECT_FAILURE(body, couchrest::errors::document_conflict);
        CHECK(body.error().get_if<couchrest::errors::document_conflict>()->response.reason() == "Document update conflict.");
    }

    SECTION("conflict for other intents is generic")
    {
        auto body = couchrest::classify_response(request_intent::lookup, json_exchange(409, R"({"error":"conflict","reason":"x"})"));
        EXPECT_FAILURE(body, couchrest::errors::server_response);
        const auto* failure = body.error().get_if<couchrest::errors::server_response>();
        CHECK(failure->status_code == 409);
        REQUIRE(failure->response.has_value());
        CHECK(failure->response->error() == "conflict");
    }

    SECTION("precondition failure for document write is generic")
    {
        auto body = couchrest::classify_response(request_intent::document_write, json_exchange(412, file_exists_body));
        EXPECT_FAILURE(body, couchrest::errors::server_response);
    }

    SECTION("not found")
    {
        for (auto intent : { request_intent::lookup, request_intent::delete_database, request_intent::view_query }) {
            INFO(fmt::format("{}", intent));
            auto body = couchrest::classify_response(intent, json_exchange(404, R"({"error":"not_found","reason":"missing"})"));
            EXPECT_FAILURE(body, couchrest::errors::not_found);
            CHECK(body.error().server_error()->reason() == "missing");
        }
    }

    SECTION("unauthorized")
    {
        for (auto status : { 401U, 403U }) {
            INFO(status);
            auto body = couchrest::classify_response(request_intent::create_database,
                                                     json_exchange(status, R"({"error":"unauthorized","reason":"You are not a server admin."})"));
            EXPECT_FAILURE(body, couchrest::errors::unauthorized);
        }
    }

    SECTION("semantic failure with malformed body")
    {
        auto body = couchrest::classify_response(request_intent::lookup, json_exchange(404, R"({"error":"not_found"})"));
        EXPECT_FAILURE(body, couchrest::errors::json_decode);
    }

    SECTION("semantic failure with non-JSON body")
    {
        couchrest::http_exchange exchange{ 401, "text/html", "<html>denied</html>", {} };
        auto body = couchrest::classify_response(request_intent::lookup, exchange);
        EXPECT_FAILURE(body, couchrest::errors::response_not_json);
    }

    SECTION("generic failure keeps status when body cannot be decoded")
    {
        couchrest::http_exchange exchange{ 502, "text/html", "<html>bad gateway</html>", {} };
        auto body = couchrest::classify_response(request_intent::lookup, exchange);
        EXPECT_FAILURE(body, couchrest::errors::server_response);
        const auto* failure = body.error().get_if<couchrest::errors::server_response>();
        CHECK(failure->status_code == 502);
        CHECK_FALSE(failure->response.has_value());
        CHECK(body.error().server_error() == nullptr);
        CHECK(body.error().message() == "The server responded with an error (502: Bad Gateway)");
    }

    SECTION("unexpected redirect")
    {
        couchrest::http_exchange exchange{ 304, {}, {}, {} };
        auto body = couchrest::classify_response(request_intent::lookup, exchange);
        EXPECT_FAILURE(body, couchrest::errors::server_response);
        CHECK(body.error().message() == "The server responded with an unexpected status (304: Not Modified)");
    }

    SECTION("raw response failures use the same mapping")
    {
        auto body = couchrest::classify_raw_response(request_intent::lookup, json_exchange(404, R"({"error":"not_found","reason":"missing"})"));
        EXPECT_FAILURE(body, couchrest::errors::not_found);
    }
}

TEST_CASE("unit: request intent formatting", "[unit]")
{
    CHECK(fmt::format("{}", couchrest::request_intent::lookup) == "lookup");
    CHECK(fmt::format("{}", couchrest::request_intent::create_database) == "create_database");
    CHECK(fmt::format("{}", couchrest::request_intent::document_write) == "document_write");
    CHECK(fmt::format("{}", couchrest::request_intent::view_query) == "view_query");
}
