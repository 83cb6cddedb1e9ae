#ifndef RFC4122_BINARY_HPP
#define RFC4122_BINARY_HPP

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

#include "./internal/export.hpp"
#include "./types_fwd.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// @file
/// @copybrief rfc4122::binary

namespace rfc4122 {

/// A raw byte sequence of any length.
///
/// Used for the binary input and output form of a uuid. Only
/// sequences of exactly 16 bytes can be turned into a uuid.
class binary : public std::vector<uint8_t> {
  public:
    /// @name Constructors
    /// @{
    explicit binary() : std::vector<value_type>() {}
    explicit binary(size_t n) : std::vector<value_type>(n) {}
    explicit binary(size_t n, value_type x) : std::vector<value_type>(n, x) {}
    binary(const value_type* p, size_t n) : std::vector<value_type>(p, p + n) {}
    template <class Iter> binary(Iter first, Iter last) : std::vector<value_type>(first, last) {}
    /// @}
};

/// Print binary value as space separated hex bytes, e.g. b[0a ff 00]
RFC4122_EXTERN std::ostream& operator<<(std::ostream&, const binary&);

} // rfc4122

#endif // RFC4122_BINARY_HPP
