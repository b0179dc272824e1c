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

#include <couchrest/design.hxx>

#include "core/design_json.hxx"
#include "core/utils/json.hxx"

#include <tao/json.hpp>

#include <optional>
#include <string>

TEST_CASE("unit: design builder", "[unit]")
{
    auto design = couchrest::design_builder{}
                    .insert_view("by_name", couchrest::view_function{ "function(doc) { emit(doc.name, null); }" })
                    .insert_view("count", couchrest::view_function{ "function(doc) { emit(doc.type, 1); }", "_count" })
                    .build();

    REQUIRE(design.views().size() == 2);
    CHECK(design.views().at("by_name").map() == "function(doc) { emit(doc.name, null); }");
    CHECK_FALSE(design.views().at("by_name").reduce().has_value());
    CHECK(design.views().at("count").reduce() == "_count");

    SECTION("inserting the same name replaces the view")
    {
        couchrest::design_builder builder{};
        builder.insert_view("v", couchrest::view_function{ "first" });
        builder.insert_view("v", couchrest::view_function{ "second" });
        auto replaced = builder.build();
        REQUIRE(replaced.views().size() == 1);
        CHECK(replaced.views().at("v").map() == "second");
    }

    SECTION("builder can be reused")
    {
        couchrest::design_builder builder{};
        builder.insert_view("a", couchrest::view_function{ "map_a" });
        auto first = builder.build();
        builder.insert_view("b", couchrest::view_function{ "map_b" });
        auto second = builder.build();
        CHECK(first.views().size() == 1);
        CHECK(second.views().size() == 2);
        CHECK(first != second);
    }
}

TEST_CASE("unit: design encoding", "[unit]")
{
    auto design = couchrest::design_builder{}
                    .insert_view("alpha", couchrest::view_function{ "map_a" })
                    .insert_view("bravo", couchrest::view_function{ "map_b", "_sum" })
                    .build();

    auto encoded = couchrest::core::utils::json::parse(design.to_json());
    REQUIRE(encoded.is_object());
    const auto& views = encoded.at("views");
    CHECK(views.get_object().size() == 2);
    CHECK(views.at("alpha").at("map").get_string() == "map_a");
    CHECK(views.at("alpha").find("reduce") == nullptr);
    CHECK(views.at("bravo").at("reduce").get_string() == "_sum");

    auto empty = couchrest::design_builder{}.build();
    CHECK(empty.to_json() == R"({"views":{}})");
}

TEST_CASE("unit: design decoding", "[unit]")
{
    SECTION("typical server response")
    {
        auto design = couchrest::design::from_json(R"({
            "_id": "_design/example",
            "_rev": "1-8f3e6c0e7f2cc9ef2fdb0b6f3a4a6e6b",
            "language": "javascript",
            "views": {
                "by_name": { "map": "function(doc) { emit(doc.name, null); }" },
                "count": { "map": "function(doc) { emit(doc.type, 1); }", "reduce": "_count" }
            }
        })");
        EXPECT_SUCCESS(design);
        REQUIRE(design->views().size() == 2);
        CHECK(design->views().at("count") == couchrest::view_function{ "function(doc) { emit(doc.type, 1); }", "_count" });
    }

    SECTION("missing views")
    {
        auto design = couchrest::design::from_json(R"({"language":"javascript"})");
        EXPECT_SUCCESS(design);
        CHECK(design->views().empty());
    }

    SECTION("null reduce is the same as absent")
    {
        auto design = couchrest::design::from_json(R"({"views":{"v":{"map":"m","reduce":null}}})");
        EXPECT_SUCCESS(design);
        CHECK_FALSE(design->views().at("v").reduce().has_value());
    }

    SECTION("decode after encode gives equal design")
    {
        auto original = couchrest::design_builder{}.insert_view("v", couchrest::view_function{ "m", "r" }).build();
        auto decoded = couchrest::design::from_json(original.to_json());
        EXPECT_SUCCESS(decoded);
        CHECK(decoded.value() == original);
    }

    SECTION("invalid documents")
    {
        for (const auto* json : {
               R"({"views":{"v":{"reduce":"_count"}}})",
               R"({"views":{"v":{"map":42}}})",
               R"({"views":[]})",
               R"({"views":{"v":"function(doc) {}"}})",
               R"({"views":{"v":{"map":"m","reduce":1}}})",
               R"({"views":"v"})",
               R"([])",
               R"({"views":)",
             }) {
            INFO(json);
            auto design = couchrest::design::from_json(json);
            EXPECT_FAILURE(design, couchrest::errors::json_decode);
        }
    }

    SECTION("type mismatch names the field")
    {
        auto design = couchrest::design::from_json(R"({"views":[]})");
        EXPECT_FAILURE(design, couchrest::errors::json_decode);
        CHECK(design.error().cause() == std::optional<std::string>{ R"(field "views" must be a JSON object)" });

        design = couchrest::design::from_json(R"({"views":{"v":{"map":"m","reduce":1}}})");
        EXPECT_FAILURE(design, couchrest::errors::json_decode);
        CHECK(design.error().cause() == std::optional<std::string>{ R"(field "reduce" must be a string)" });
    }
}
