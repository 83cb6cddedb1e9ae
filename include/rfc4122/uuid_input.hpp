#ifndef RFC4122_UUID_INPUT_HPP
#define RFC4122_UUID_INPUT_HPP

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
/// @copybrief rfc4122::uuid_input

#include "./binary.hpp"
#include "./byte_array.hpp"
#include "./internal/export.hpp"
#include "./null.hpp"
#include "./types_fwd.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace rfc4122 {

/// Any value that can be turned into a uuid.
///
/// Holds one of: nothing (null), a string in the 36 character
/// RFC-4122 form or the 32 character hex form, a raw byte sequence,
/// or the bytes of an existing uuid. Conversions are implicit so
/// that every uuid operation accepts each of these directly:
///
///     uuid::compare("9e472052-a654-4693-9a8b-3ce57ada3d6c", u);
///     uuid::is_valid(binary(16, 0));
///
/// A uuid_input copies what it is given, it never refers back to the
/// original string, bytes or uuid.
class uuid_input {
  public:
    /// The shape of the held value
    enum input_type {
        NULL_INPUT,             ///< Nothing
        STRING_INPUT,           ///< A string of any length
        BYTES_INPUT,            ///< A byte sequence of any length
        UUID_INPUT              ///< The 16 bytes of a uuid
    };

    /// @name Constructors
    /// @{
    RFC4122_EXTERN uuid_input();
    RFC4122_EXTERN uuid_input(const null&);
    RFC4122_EXTERN uuid_input(std::nullptr_t);
    /// A null pointer is treated as null, not as an empty string
    RFC4122_EXTERN uuid_input(const char* s);
    RFC4122_EXTERN uuid_input(const std::string& s);
    RFC4122_EXTERN uuid_input(const binary& b);
    RFC4122_EXTERN uuid_input(const byte_array<16>& b);
    RFC4122_EXTERN uuid_input(const uuid& u);
    /// @}

    /// Shape of the held value
    RFC4122_EXTERN input_type type() const;

    /// True if type() == NULL_INPUT
    RFC4122_EXTERN bool empty() const;

    /// The held string.
    /// @throw invalid_input_error unless type() == STRING_INPUT
    RFC4122_EXTERN const std::string& string() const;

    /// The held bytes.
    /// @throw invalid_input_error unless type() is BYTES_INPUT or UUID_INPUT
    RFC4122_EXTERN const binary& bytes() const;

  private:
    input_type type_;
    std::string string_;
    binary bytes_;
};

/// Name of an input type for messages, e.g. "string"
RFC4122_EXTERN std::string type_name(uuid_input::input_type);

/// Describe the held value for diagnostics: its type followed by its
/// content, e.g. [string] "abc" or [bytes] b[0a ff]
RFC4122_EXTERN std::ostream& operator<<(std::ostream&, const uuid_input&);

} // rfc4122

#endif // RFC4122_UUID_INPUT_HPP
