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

#include <rfc4122/codec.hpp>
#include <rfc4122/error.hpp>

#include <string>

namespace {

using rfc4122::byte_array;
using rfc4122::format_error;
using namespace rfc4122::codec;

TEST_CASE("hex to bytes", "[codec]") {
    SECTION("decodes pairs of digits in order") {
        byte_array<16> b = hex_to_bytes("000102030405060708090a0b0c0d0e0f");
        for (size_t i = 0; i < b.size(); ++i)
            CHECK(b[i] == i);
    }
    SECTION("accepts either case") {
        CHECK(hex_to_bytes("9E472052A65446939A8B3CE57ADA3D6C") ==
              hex_to_bytes("9e472052a65446939a8b3ce57ada3d6c"));
        byte_array<16> b = hex_to_bytes("FFfFfFfFfFfFfFfFfFfFfFfFfFfFfFfF");
        CHECK(b == byte_array<16>(0xff));
    }
    SECTION("rejects wrong length") {
        CHECK_THROWS_AS(hex_to_bytes(""), format_error);
        CHECK_THROWS_AS(hex_to_bytes("000102030405060708090a0b0c0d0e0"), format_error);
        CHECK_THROWS_AS(hex_to_bytes("000102030405060708090a0b0c0d0e0f0"), format_error);
        CHECK_THROWS_WITH(hex_to_bytes("abc"), Catch::Contains("expected 32 got 3"));
    }
    SECTION("rejects non-hex characters") {
        CHECK_THROWS_AS(hex_to_bytes("g00102030405060708090a0b0c0d0e0f"), format_error);
        CHECK_THROWS_AS(hex_to_bytes("00010203-405060708090a0b0c0d0e0f"), format_error);
        CHECK_THROWS_WITH(hex_to_bytes("0001020304050607080z0a0b0c0d0e0f"),
                          Catch::Contains("position 19"));
    }
}

TEST_CASE("bytes to hex", "[codec]") {
    CHECK(bytes_to_hex(byte_array<16>()) == std::string(32, '0'));
    CHECK(bytes_to_hex(byte_array<16>(0xff)) == std::string(32, 'f'));
    CHECK(bytes_to_hex(hex_to_bytes("9E472052A65446939A8B3CE57ADA3D6C")) ==
          "9e472052a65446939a8b3ce57ada3d6c");
}

TEST_CASE("hex digits", "[codec]") {
    const std::string digits("0123456789abcdefABCDEF");
    for (size_t i = 0; i < digits.size(); ++i)
        CHECK(is_hex_digit(digits[i]));
    CHECK_FALSE(is_hex_digit('g'));
    CHECK_FALSE(is_hex_digit('G'));
    CHECK_FALSE(is_hex_digit('-'));
    CHECK_FALSE(is_hex_digit(' '));
    CHECK_FALSE(is_hex_digit('\0'));
}

} // namespace
