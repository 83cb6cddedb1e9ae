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

#include "logger_internal.hpp"
#include "types_internal.hpp"

#include "rfc4122/codec.hpp"
#include "rfc4122/error.hpp"

namespace rfc4122 {
namespace codec {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

}

bool is_hex_digit(char c) { return hex_value(c) != -1; }

byte_array<16> hex_to_bytes(const std::string& hex) {
    if (hex.size() != HEX_LENGTH) {
        RFC4122_LOG(SUBSYSTEM_CODEC, LEVEL_DEBUG, "hex length " << hex.size() << " rejected");
        throw format_error(MSG("invalid hex length, expected " << HEX_LENGTH << " got " << hex.size()));
    }
    byte_array<16> bytes;
    for (size_t i = 0; i < bytes.size(); ++i) {
        int hi = hex_value(hex[2*i]);
        int lo = hex_value(hex[2*i+1]);
        if (hi < 0 || lo < 0) {
            size_t at = hi < 0 ? 2*i : 2*i+1;
            RFC4122_LOG(SUBSYSTEM_CODEC, LEVEL_DEBUG, "non-hex character at " << at << " rejected");
            throw format_error(MSG("invalid hex character at position " << at));
        }
        bytes[i] = uint8_t((hi << 4) | lo);
    }
    return bytes;
}

std::string bytes_to_hex(const byte_array<16>& bytes) {
    std::string hex;
    hex.reserve(HEX_LENGTH);
    for (size_t i = 0; i < bytes.size(); ++i) {
        hex += hex_digit(bytes[i] >> 4);
        hex += hex_digit(bytes[i]);
    }
    return hex;
}

}}
