#ifndef RFC4122_CODEC_HPP
#define RFC4122_CODEC_HPP

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

/// @file
/// Conversion between hexadecimal text and uuid bytes.

#include "./byte_array.hpp"
#include "./internal/export.hpp"

#include <string>

namespace rfc4122 {
namespace codec {

/// Number of hex digits in the compact form of a uuid.
const size_t HEX_LENGTH = 32;

/// True if c is 0-9, a-f or A-F.
RFC4122_EXTERN bool is_hex_digit(char c);

/// Decode 32 hex digits, either case, into 16 bytes.
///
/// @throw format_error if hex is not exactly 32 characters or
/// contains a non-hex character.
RFC4122_EXTERN byte_array<16> hex_to_bytes(const std::string& hex);

/// Encode 16 bytes as 32 lowercase hex digits with no separators.
RFC4122_EXTERN std::string bytes_to_hex(const byte_array<16>& bytes);

} // codec
} // rfc4122

#endif // RFC4122_CODEC_HPP
