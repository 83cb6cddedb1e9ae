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
#include <rfc4122/logger.hpp>
#include <rfc4122/uuid.hpp>

#include <string>
#include <vector>

namespace {

using namespace rfc4122;

struct log_record {
    logger::subsystem subsystem;
    logger::level level;
    std::string message;
};

typedef std::vector<log_record> log_records;

void capture(intptr_t context, logger::subsystem s, logger::level l, const char* message) {
    log_record r = { s, l, message };
    reinterpret_cast<log_records*>(context)->push_back(r);
}

TEST_CASE("logger masks", "[logger]") {
    logger l;
    log_records records;
    l.set_sink(capture, reinterpret_cast<intptr_t>(&records));

    SECTION("defaults") {
        CHECK(l.level_mask() == logger::LEVEL_NONE);
        CHECK(l.subsystem_mask() == logger::SUBSYSTEM_ALL);
        CHECK_FALSE(l.enabled(logger::SUBSYSTEM_PARSE, logger::LEVEL_DEBUG));
        l.log(logger::SUBSYSTEM_PARSE, logger::LEVEL_ERROR, "dropped");
        CHECK(records.empty());
    }
    SECTION("critical is always emitted") {
        l.reset_mask(logger::SUBSYSTEM_ALL, logger::LEVEL_ALL);
        CHECK(l.enabled(logger::SUBSYSTEM_CODEC, logger::LEVEL_CRITICAL));
        l.log(logger::SUBSYSTEM_CODEC, logger::LEVEL_CRITICAL, "boom");
        REQUIRE(records.size() == 1);
        CHECK(records[0].message == "boom");
        CHECK(records[0].level == logger::LEVEL_CRITICAL);
        CHECK(records[0].subsystem == logger::SUBSYSTEM_CODEC);
    }
    SECTION("set and reset") {
        l.set_mask(logger::SUBSYSTEM_NONE, logger::LEVEL_DEBUG | logger::LEVEL_INFO);
        CHECK(l.enabled(logger::SUBSYSTEM_PARSE, logger::LEVEL_DEBUG));
        CHECK_FALSE(l.enabled(logger::SUBSYSTEM_PARSE, logger::LEVEL_TRACE));
        l.reset_mask(logger::SUBSYSTEM_PARSE, logger::LEVEL_NONE);
        CHECK_FALSE(l.enabled(logger::SUBSYSTEM_PARSE, logger::LEVEL_DEBUG));
        CHECK(l.enabled(logger::SUBSYSTEM_CONFIG, logger::LEVEL_DEBUG));
        l.log(logger::SUBSYSTEM_PARSE, logger::LEVEL_DEBUG, "dropped");
        l.log(logger::SUBSYSTEM_CONFIG, logger::LEVEL_INFO, "kept");
        REQUIRE(records.size() == 1);
        CHECK(records[0].message == "kept");
    }
}

TEST_CASE("logger names", "[logger]") {
    CHECK(std::string(logger::level_name(logger::LEVEL_WARNING)) == "warning");
    CHECK(std::string(logger::subsystem_name(logger::SUBSYSTEM_RANDOM)) == "random");

    CHECK(logger::parse_level("debug") == logger::LEVEL_DEBUG);
    CHECK(logger::parse_level("all") == logger::LEVEL_ALL);
    CHECK(logger::parse_level("error+") == (logger::LEVEL_CRITICAL | logger::LEVEL_ERROR));
    CHECK(logger::parse_level("info+") ==
          (logger::LEVEL_CRITICAL | logger::LEVEL_ERROR | logger::LEVEL_WARNING | logger::LEVEL_INFO));
    CHECK_THROWS_AS(logger::parse_level("loud"), error);
    CHECK_THROWS_AS(logger::parse_level("none+"), error);
    CHECK_THROWS_AS(logger::parse_level("all+"), error);
    CHECK_THROWS_AS(logger::parse_level(""), error);
    CHECK_THROWS_WITH(logger::parse_level("loud"), Catch::Contains("unknown log level 'loud'"));

    CHECK(logger::parse_subsystem("parse") == logger::SUBSYSTEM_PARSE);
    CHECK(logger::parse_subsystem("all") == logger::SUBSYSTEM_ALL);
    CHECK_THROWS_AS(logger::parse_subsystem("network"), error);
}

TEST_CASE("parse rejections are logged", "[logger]") {
    logger& l = logger::default_logger();
    log_records records;
    l.set_sink(capture, reinterpret_cast<intptr_t>(&records));
    l.set_mask(logger::SUBSYSTEM_PARSE, logger::LEVEL_DEBUG);

    CHECK_THROWS_AS(uuid::from("abc"), format_error);
    CHECK_FALSE(uuid::is_valid("abc"));

    l.reset_mask(logger::SUBSYSTEM_ALL, logger::LEVEL_ALL);
    l.set_mask(logger::SUBSYSTEM_ALL, logger::LEVEL_NONE);
    l.set_sink(0);

    // is_valid() reports without logging
    REQUIRE(records.size() == 1);
    CHECK(records[0].subsystem == logger::SUBSYSTEM_PARSE);
    CHECK(records[0].level == logger::LEVEL_DEBUG);
    CHECK(records[0].message == "rejected string of length 3");
}

} // namespace
