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

#include <rfc4122/config.hpp>
#include <rfc4122/error.hpp>
#include <rfc4122/logger.hpp>
#include <rfc4122/random_source.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace {

using namespace std;
using namespace rfc4122;

config configure(const string& text) {
    istringstream is(text);
    return config_file::parse(is);
}

// Hack to write strings with embedded '"' and newlines
#define RAW_STRING(...) #__VA_ARGS__

TEST_CASE("default configuration", "[config]") {
    config c = configure("{}");
    CHECK(c.log_levels() == logger::LEVEL_NONE);
    CHECK(c.log_subsystems() == logger::SUBSYSTEM_ALL);
    CHECK(c.random_device() == "default");
}

TEST_CASE("log configuration", "[config]") {
    CHECK(configure(RAW_STRING({"log": {"level": "debug"}})).log_levels() == logger::LEVEL_DEBUG);
    CHECK(configure(RAW_STRING({"log": {"level": "warning+"}})).log_levels() ==
          (logger::LEVEL_CRITICAL | logger::LEVEL_ERROR | logger::LEVEL_WARNING));
    CHECK(configure(RAW_STRING({"log": {"level": ["error", "trace"]}})).log_levels() ==
          (logger::LEVEL_ERROR | logger::LEVEL_TRACE));
    CHECK(configure(RAW_STRING({"log": {"subsystems": "parse"}})).log_subsystems() == logger::SUBSYSTEM_PARSE);
    CHECK(configure(RAW_STRING({"log": {"subsystems": ["codec", "random"]}})).log_subsystems() ==
          (logger::SUBSYSTEM_CODEC | logger::SUBSYSTEM_RANDOM));
    CHECK(configure("{ \"log\": { /* inline comment */ \"level\": \"info\" } // end of line comment\n}").log_levels() ==
          logger::LEVEL_INFO);
}

TEST_CASE("random configuration", "[config]") {
    CHECK(configure(RAW_STRING({"random": {"device": "/dev/urandom"}})).random_device() == "/dev/urandom");
    CHECK(configure(RAW_STRING({"random": {}})).random_device() == "default");
}

TEST_CASE("invalid configuration", "[config]") {
    CHECK_THROWS_AS(configure("[]"), rfc4122::error);
    CHECK_THROWS_WITH(configure("[]"), Catch::Contains("'configuration' expected object, found array"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"log": true})), Catch::Contains("'log' expected object, found boolean"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"random": {"device": 1}})),
                      Catch::Contains("'device' expected string, found int"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"log": {"level": 3}})),
                      Catch::Contains("'log/level' expected string or array, found int"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"log": {"level": ["debug", 3]}})),
                      Catch::Contains("'log/level' expected string, found int"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"log": {"level": "loud"}})),
                      Catch::Contains("'log/level' unknown log level 'loud'"));
    CHECK_THROWS_WITH(configure(RAW_STRING({"log": {"subsystems": ["parse", "network"]}})),
                      Catch::Contains("'log/subsystems' unknown log subsystem 'network'"));
}

TEST_CASE("invalid json", "[config]") {
    CHECK_THROWS_AS(configure("{"), rfc4122::error);
    CHECK_THROWS_AS(configure(""), rfc4122::error);
    CHECK_THROWS_WITH(configure("{"), Catch::StartsWith("configuration: "));
}

TEST_CASE("default file", "[config]") {
    ::setenv("HOME", "no-such-home-directory", 1);

    ::setenv("RFC4122_CONFIG_FILE", "environment.json", 1);
    ofstream("environment.json") << RAW_STRING({"log": {"level": "error"}}) << endl;
    ofstream("rfc4122.json") << RAW_STRING({"log": {"level": "trace"}}) << endl;
    CHECK(config_file::default_file() == "environment.json");
    CHECK(config_file::parse_default().log_levels() == logger::LEVEL_ERROR);

    ::unsetenv("RFC4122_CONFIG_FILE");
    CHECK(config_file::default_file() == "rfc4122.json");
    CHECK(config_file::parse_default().log_levels() == logger::LEVEL_TRACE);

    // A file named by the environment must exist.
    ::setenv("RFC4122_CONFIG_FILE", "no-such-file.json", 1);
    CHECK_THROWS_WITH(config_file::default_file(), Catch::Contains("no-such-file.json"));
    CHECK_THROWS_AS(config_file::parse_default(), rfc4122::error);

    ::unsetenv("RFC4122_CONFIG_FILE");
    remove("environment.json");
    remove("rfc4122.json");
}

TEST_CASE("apply configuration", "[config]") {
    logger& l = logger::default_logger();

    SECTION("masks are replaced") {
        l.set_mask(logger::SUBSYSTEM_ALL, logger::LEVEL_TRACE);
        configure(RAW_STRING({"log": {"level": "info+", "subsystems": "config"}})).apply();
        CHECK(l.level_mask() == (logger::LEVEL_CRITICAL | logger::LEVEL_ERROR |
                                 logger::LEVEL_WARNING | logger::LEVEL_INFO));
        CHECK(l.subsystem_mask() == logger::SUBSYSTEM_CONFIG);
        CHECK_FALSE(l.enabled(logger::SUBSYSTEM_PARSE, logger::LEVEL_ERROR));
    }
    SECTION("from the default file") {
        ::setenv("RFC4122_CONFIG_FILE", "apply.json", 1);
        ofstream("apply.json") << RAW_STRING({"log": {"level": "debug", "subsystems": ["parse"]}}) << endl;
        config c = apply_config();
        CHECK(c.log_levels() == logger::LEVEL_DEBUG);
        CHECK(l.level_mask() == logger::LEVEL_DEBUG);
        CHECK(l.subsystem_mask() == logger::SUBSYSTEM_PARSE);
        ::unsetenv("RFC4122_CONFIG_FILE");
        remove("apply.json");
    }
    SECTION("bad random device") {
        CHECK_THROWS_AS(config().random_device("no-such-random-device").apply(), rfc4122::error);
        CHECK(random_source::default_token() == "default");
    }

    config().apply();
    CHECK(l.level_mask() == logger::LEVEL_NONE);
    CHECK(l.subsystem_mask() == logger::SUBSYSTEM_ALL);
}

} // namespace
