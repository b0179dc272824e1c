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

#include <couchrest/resource_path.hxx>

#include "core/utils/path_segment.hxx"

#include <set>

using couchrest::errc::path_parse;

TEST_CASE("unit: database path", "[unit]")
{
    SECTION("make and render")
    {
        auto path = couchrest::database_path::make("alpha");
        EXPECT_SUCCESS(path);
        CHECK(path->name() == "alpha");
        CHECK(path->to_string() == "/alpha");
    }

    SECTION("segment is percent-encoded")
    {
        auto path = couchrest::database_path::make("a b+c");
        EXPECT_SUCCESS(path);
        CHECK(path->to_string() == "/a%20b+c");
        CHECK(couchrest::database_path::parse(path->to_string()).value() == path.value());
    }

    SECTION("invalid names")
    {
        auto empty = couchrest::database_path::make("");
        REQUIRE_FALSE(empty);
        CHECK(empty.error().kind == path_parse::empty_segment);

        auto slash = couchrest::database_path::make("a/b");
        REQUIRE_FALSE(slash);
        CHECK(slash.error().kind == path_parse::bad_segment);
        CHECK(slash.error().detail == R"(unexpected separator "/")");
    }

    SECTION("parse")
    {
        CHECK(couchrest::database_path::parse("/alpha").value().name() == "alpha");
        CHECK(couchrest::database_path::parse("alpha").error().kind == path_parse::no_leading_slash);
        CHECK(couchrest::database_path::parse("").error().kind == path_parse::no_leading_slash);
        CHECK(couchrest::database_path::parse("/alpha/").error().kind == path_parse::trailing_slash);
        CHECK(couchrest::database_path::parse("/").error().kind == path_parse::empty_segment);
        CHECK(couchrest::database_path::parse("/alpha/bravo").error().kind == path_parse::too_many_segments);
        CHECK(couchrest::database_path::parse("//alpha").error().kind == path_parse::empty_segment);
    }

    SECTION("encoded separator is rejected after decoding")
    {
        auto path = couchrest::database_path::parse("/a%2Fb");
        REQUIRE_FALSE(path);
        CHECK(path.error().kind == path_parse::bad_segment);
    }

    SECTION("malformed percent-encoding")
    {
        for (const auto* text : { "/a%2", "/a%zz", "/%" }) {
            INFO(text);
            auto path = couchrest::database_path::parse(text);
            REQUIRE_FALSE(path);
            CHECK(path.error().kind == path_parse::bad_segment);
            CHECK(path.error().detail == "invalid percent-encoding");
        }
    }
}

TEST_CASE("unit: document path", "[unit]")
{
    auto db = couchrest::database_path::make("alpha").value();

    SECTION("derived from the database")
    {
        auto path = db.document("bravo");
        EXPECT_SUCCESS(path);
        CHECK(path->database_name() == "alpha");
        CHECK(path->id() == "bravo");
        CHECK(path->database() == db);
        CHECK(path->to_string() == "/alpha/bravo");
    }

    SECTION("id with a slash is rejected")
    {
        auto path = db.document("bravo/charlie");
        REQUIRE_FALSE(path);
        CHECK(path.error().kind == path_parse::bad_segment);
    }

    SECTION("special characters survive rendering")
    {
        auto path = couchrest::document_path::make("alpha", "id?with;odd,chars").value();
        CHECK(path.to_string() == "/alpha/id%3Fwith%3Bodd%2Cchars");
        CHECK(couchrest::document_path::parse(path.to_string()).value() == path);
    }

    SECTION("parse")
    {
        auto path = couchrest::document_path::parse("/alpha/bravo");
        EXPECT_SUCCESS(path);
        CHECK(path->id() == "bravo");
        CHECK(couchrest::document_path::parse("/alpha").error().kind == path_parse::too_few_segments);
        CHECK(couchrest::document_path::parse("/alpha/bravo/charlie").error().kind == path_parse::too_many_segments);
        CHECK(couchrest::document_path::parse("/alpha//bravo").error().kind == path_parse::empty_segment);
        CHECK(couchrest::document_path::parse("/alpha/bravo/").error().kind == path_parse::trailing_slash);
    }
}

TEST_CASE("unit: attachment path", "[unit]")
{
    auto doc = couchrest::document_path::make("alpha", "bravo").value();

    auto path = doc.attachment("photo.png");
    EXPECT_SUCCESS(path);
    CHECK(path->database_name() == "alpha");
    CHECK(path->document_id() == "bravo");
    CHECK(path->name() == "photo.png");
    CHECK(path->document() == doc);
    CHECK(path->database().name() == "alpha");
    CHECK(path->to_string() == "/alpha/bravo/photo.png");
    CHECK(couchrest::attachment_path::parse("/alpha/bravo/photo.png").value() == path.value());

    CHECK(doc.attachment("").error().kind == path_parse::empty_segment);
    CHECK(couchrest::attachment_path::parse("/alpha/bravo").error().kind == path_parse::too_few_segments);
    CHECK(couchrest::attachment_path::parse("/alpha/bravo/c/d").error().kind == path_parse::too_many_segments);
}

TEST_CASE("unit: design document path", "[unit]")
{
    auto db = couchrest::database_path::make("alpha").value();

    SECTION("derived from the database")
    {
        auto path = db.design_document("bravo");
        EXPECT_SUCCESS(path);
        CHECK(path->database_name() == "alpha");
        CHECK(path->name() == "bravo");
        CHECK(path->database() == db);
        CHECK(path->to_string() == "/alpha/_design/bravo");
    }

    SECTION("parse")
    {
        auto path = couchrest::design_document_path::parse("/alpha/_design/bravo");
        EXPECT_SUCCESS(path);
        CHECK(path->name() == "bravo");
    }

    SECTION("literal segment must match")
    {
        auto path = couchrest::design_document_path::parse("/alpha/_desing/bravo");
        REQUIRE_FALSE(path);
        CHECK(path.error().kind == path_parse::bad_segment);
        CHECK(path.error().detail == R"(expected "_design")");
    }

    SECTION("segment count")
    {
        CHECK(couchrest::design_document_path::parse("/alpha/_design").error().kind == path_parse::too_few_segments);
        CHECK(couchrest::design_document_path::parse("/alpha/_design/bravo/charlie").error().kind == path_parse::too_many_segments);
    }
}

TEST_CASE("unit: view path", "[unit]")
{
    auto ddoc = couchrest::design_document_path::make("alpha", "bravo").value();

    auto path = ddoc.view("charlie");
    EXPECT_SUCCESS(path);
    CHECK(path->database_name() == "alpha");
    CHECK(path->design_document_name() == "bravo");
    CHECK(path->name() == "charlie");
    CHECK(path->design_document() == ddoc);
    CHECK(path->database().name() == "alpha");
    CHECK(path->to_string() == "/alpha/_design/bravo/_view/charlie");
    CHECK(couchrest::view_path::parse(path->to_string()).value() == path.value());

    auto wrong_literal = couchrest::view_path::parse("/alpha/_design/bravo/_show/charlie");
    REQUIRE_FALSE(wrong_literal);
    CHECK(wrong_literal.error().kind == path_parse::bad_segment);
    CHECK(wrong_literal.error().detail == R"(expected "_view")");

    CHECK(couchrest::view_path::parse("/alpha/_design/bravo/_view").error().kind == path_parse::too_few_segments);
    CHECK(ddoc.view("a/b").error().kind == path_parse::bad_segment);
}

TEST_CASE("unit: resource path ordering", "[unit]")
{
    std::set<couchrest::document_path> paths{
        couchrest::document_path::make("b", "1").value(),
        couchrest::document_path::make("a", "2").value(),
        couchrest::document_path::make("a", "1").value(),
        couchrest::document_path::make("a", "1").value(),
    };
    REQUIRE(paths.size() == 3);
    CHECK(paths.begin()->to_string() == "/a/1");
    CHECK(paths.rbegin()->to_string() == "/b/1");
}

TEST_CASE("unit: path segment validation", "[unit]")
{
    using couchrest::core::utils::path_segment::validate;

    CHECK_FALSE(validate("alpha").has_value());
    CHECK_FALSE(validate("with space").has_value());
    CHECK(validate("").value().kind == path_parse::empty_segment);
    CHECK(validate("/").value().kind == path_parse::bad_segment);

    CHECK(couchrest::core::utils::path_segment::encode("a/b c") == "a%2Fb%20c");
}

TEST_CASE("unit: path parse error messages", "[unit]")
{
    couchrest::error err = couchrest::errors::path_parse{ path_parse::bad_segment, R"(expected "_design")" };
    CHECK(err.message() == R"(The path is badly formatted: Path segment is bad (expected "_design"))");

    couchrest::error leading = couchrest::errors::path_parse{ path_parse::no_leading_slash };
    CHECK(leading.message() == "The path is badly formatted: Path does not begin with a slash");

    std::error_code ec = path_parse::trailing_slash;
    CHECK(ec.category().name() == std::string("couchrest.path_parse"));
    CHECK(ec.value() == 6);
}
