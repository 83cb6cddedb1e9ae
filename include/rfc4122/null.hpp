#ifndef RFC4122_NULL_HPP
#define RFC4122_NULL_HPP

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
/// @copybrief rfc4122::null

#include "./internal/export.hpp"

#include <cstddef>
#include <iosfwd>

namespace rfc4122 {

/// The absent value.
///
/// A uuid_input constructed from null, nullptr or a null const char*
/// holds no value. Parsing it raises invalid_input_error, validating
/// it returns false.
class null {
  public:
    null() {}
    /// Constructed from nullptr literal
    null(std::nullptr_t) {}
};

/// Print a null value
RFC4122_EXTERN std::ostream& operator<<(std::ostream&, const null&);

} // rfc4122

#endif // RFC4122_NULL_HPP
