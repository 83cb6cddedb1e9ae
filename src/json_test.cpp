/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include <catch2/catch.hpp>

#include <rfc4122/error.hpp>
#include <rfc4122/json.hpp>
#include <rfc4122/uuid.hpp>

#include <json/reader.h>

#include <sstream>
#include <string>

namespace {

using namespace rfc4122;

const std::string EXAMPLE("9e472052-a654-4693-9a8b-3ce57ada3d6c");

Json::Value parse_json(const std::string& s) {
    std::istringstream is(s);
    Json::Value v;
    is >> v;
    return v;
}

Json::Value byte_values(const binary& b) {
    Json::Value v(Json::arrayValue);
    for (size_t i = 0; i < b.size(); ++i) v.append(Json::Value(int(b[i])));
    return v;
}

TEST_CASE("to_json", "[json]") {
    Json::Value v = json::to_json(uuid::from(EXAMPLE));
    CHECK(v.isString());
    CHECK(v.asString() == EXAMPLE);
    CHECK(json::to_json(uuid::nil()).asString() == "00000000-0000-0000-0000-000000000000");

    const uuid u = uuid::v4();
    CHECK(json::from_json(json::to_json(u)) == u);
    CHECK(json::from_json(json::to_json(uuid::from(EXAMPLE))).str() == EXAMPLE);
    // max has version f, its string form does not parse back
    CHECK_THROWS_AS(json::from_json(json::to_json(uuid::max())), format_error);
    CHECK_THROWS_AS(json::from_json(json::to_json(uuid::nil())), format_error);
}

TEST_CASE("from_json", "[json]") {
    SECTION("strings") {
        CHECK(json::from_json(Json::Value(EXAMPLE)).str() == EXAMPLE);
        CHECK(json::from_json(Json::Value("9e472052a65446939a8b3ce57ada3d6c")).str() == EXAMPLE);
        CHECK_THROWS_AS(json::from_json(Json::Value("not-a-uuid")), format_error);
    }
    SECTION("byte arrays") {
        binary b = uuid::from(EXAMPLE).to_bytes();
        CHECK(json::from_json(byte_values(b)).str() == EXAMPLE);
        CHECK(json::from_json(parse_json("[1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1]")).to_bytes() == binary(16, 1));
        CHECK_THROWS_AS(json::from_json(parse_json("[1,2,3]")), format_error);
        CHECK_THROWS_AS(json::from_json(Json::Value(Json::arrayValue)), format_error);
    }
    SECTION("array elements must be bytes") {
        CHECK_THROWS_AS(json::from_json(parse_json("[256,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1]")), format_error);
        CHECK_THROWS_AS(json::from_json(parse_json("[-1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1]")), format_error);
        CHECK_THROWS_AS(json::from_json(parse_json("[\"a\",1,1,1,1,1,1,1,1,1,1,1,1,1,1,1]")), format_error);
        CHECK_THROWS_WITH(json::from_json(parse_json("[1.5]")), Catch::Contains("invalid byte array"));
    }
    SECTION("other types") {
        CHECK_THROWS_AS(json::from_json(Json::Value()), invalid_input_error);
        CHECK_THROWS_AS(json::from_json(Json::Value(42)), invalid_input_error);
        CHECK_THROWS_AS(json::from_json(Json::Value(true)), invalid_input_error);
        CHECK_THROWS_AS(json::from_json(parse_json("{\"a\":1}")), invalid_input_error);
        CHECK_THROWS_WITH(json::from_json(Json::Value(42)), Catch::Contains("[int] 42"));
        CHECK_THROWS_WITH(json::from_json(Json::Value()), Catch::Contains("[null] null"));
    }
}

TEST_CASE("json is_valid", "[json]") {
    CHECK(json::is_valid(Json::Value(EXAMPLE)));
    CHECK(json::is_valid(byte_values(uuid::from(EXAMPLE).to_bytes())));
    CHECK_FALSE(json::is_valid(Json::Value("not-a-uuid")));
    CHECK_FALSE(json::is_valid(byte_values(binary(16, 1))));
    CHECK_FALSE(json::is_valid(parse_json("[300]")));
    CHECK_FALSE(json::is_valid(Json::Value()));
    CHECK_FALSE(json::is_valid(Json::Value(1.5)));
    CHECK_FALSE(json::is_valid(parse_json("{}")));
}

} // namespace
