#ifndef RFC4122_TYPES_INTERNAL_HPP
#define RFC4122_TYPES_INTERNAL_HPP

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

#include "msg.hpp"

#include <ios>
#include <stdint.h>

///@file
/// Internal helpers for formatting bytes.

namespace rfc4122 {

/// Save and restore the format flags of a stream.
struct ios_guard {
    std::ios &guarded;
    std::ios old;
    ios_guard(std::ios& x) : guarded(x), old(0) { old.copyfmt(guarded); }
    ~ios_guard() { guarded.copyfmt(old); }
};

/// A byte as an unsigned int so streams print it as a number, not a char.
inline unsigned int printable_byte(uint8_t byte) { return byte; }

/// Lowercase hex digit for the low 4 bits of n.
inline char hex_digit(unsigned int n) { return "0123456789abcdef"[n & 0xf]; }

}

#endif // RFC4122_TYPES_INTERNAL_HPP
