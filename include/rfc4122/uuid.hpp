#ifndef RFC4122_UUID_HPP
#define RFC4122_UUID_HPP

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
/// @copybrief rfc4122::uuid

#include "./binary.hpp"
#include "./byte_array.hpp"
#include "./internal/comparable.hpp"
#include "./internal/export.hpp"
#include "./types_fwd.hpp"
#include "./uuid_input.hpp"

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace rfc4122 {

/// A 16-byte universally unique identifier.
///
/// The 16 bytes are fixed when the uuid is constructed. The hex and
/// canonical string forms are computed on first use and cached.
///
/// Strings are parsed strictly: both the 36 character RFC-4122 form
/// and the 32 character hex form must carry a version digit of 1-5
/// and a variant digit of 8, 9, a or b. Raw bytes are NOT checked:
/// any 16 bytes construct a uuid, so
///
///     uuid u = uuid::from_bytes(binary(16, 0x01));  // succeeds
///     uuid::is_valid(u);                            // false
///
/// Use is_valid() or is_valid_bytes() when version and variant
/// matter for byte input.
class uuid : private internal::comparable<uuid> {
  public:
    /// Number of bytes in a uuid
    static const size_t SIZE = 16;

    /// Length of the RFC-4122 string form
    static const size_t STRING_LENGTH = 36;

    /// Length of the hex string form
    static const size_t HEX_LENGTH = 32;

    /// Parse any supported input, see from()
    RFC4122_EXTERN explicit uuid(const uuid_input& input);

    /// Copies the bytes, not the cached strings
    RFC4122_EXTERN uuid(const uuid&);
    RFC4122_EXTERN uuid& operator=(const uuid&);

    /// @name Factories
    /// @{

    /// Parse any supported input.
    ///
    /// - string of length 36: must be a valid RFC-4122 string
    /// - string of length 32: must be a valid hex string
    /// - bytes: must be 16 bytes long, content is not checked
    /// - uuid: copied
    ///
    /// @throw format_error for strings or bytes of the wrong length or
    /// content
    /// @throw invalid_input_error for null
    RFC4122_EXTERN static uuid from(const uuid_input& input);

    /// Parse the 32 character hex form.
    /// @throw format_error if hex is not a valid hex string
    RFC4122_EXTERN static uuid from_hex(const std::string& hex);

    /// Parse the 36 character RFC-4122 form.
    /// @throw format_error if s is not a valid RFC-4122 string
    RFC4122_EXTERN static uuid from_string(const std::string& s);

    /// Copy 16 bytes.
    /// @throw format_error if b.size() != 16
    RFC4122_EXTERN static uuid from_bytes(const binary& b);

    /// Copy n bytes starting at p.
    /// @throw format_error if n != 16
    /// @throw invalid_input_error if p is null
    RFC4122_EXTERN static uuid from_bytes(const uint8_t* p, size_t n);

    /// The nil uuid, 00000000-0000-0000-0000-000000000000
    RFC4122_EXTERN static uuid nil();

    /// The max uuid, ffffffff-ffff-ffff-ffff-ffffffffffff
    RFC4122_EXTERN static uuid max();

    /// A random version 4 uuid from random_source::default_source()
    RFC4122_EXTERN static uuid v4();

    /// A random version 4 uuid using bytes from source
    RFC4122_EXTERN static uuid v4(random_source& source);
    /// @}

    /// @name Validation
    /// None of these throw.
    /// @{
    RFC4122_EXTERN static bool is_valid_hex(const std::string& hex);
    RFC4122_EXTERN static bool is_valid_string(const std::string& s);

    /// 16 bytes with version 1-5 and the RFC-4122 variant
    RFC4122_EXTERN static bool is_valid_bytes(const binary& b);

    /// True if input is a valid string, hex string, byte sequence or a
    /// uuid whose bytes are valid. False for null and anything else.
    RFC4122_EXTERN static bool is_valid(const uuid_input& input);
    /// @}

    /// High nibble of byte 6, 0-15. Input other than bytes is parsed first.
    /// @throw format_error for bytes whose length is not 16, or for
    /// inputs that do not parse
    RFC4122_EXTERN static int version(const uuid_input& input);

    /// High nibble of byte 6, 0-15
    RFC4122_EXTERN int version() const;

    /// @name Equality and ordering
    /// @{

    /// True if every input parses to the same bytes.
    ///
    /// Returns false without throwing if any input is null.
    /// @throw invalid_argument_error if there are fewer than two inputs
    /// @throw format_error, invalid_input_error if a non-null input
    /// does not parse
    RFC4122_EXTERN static bool equals(const std::vector<uuid_input>& inputs);

    /// Same as equals() with two inputs
    RFC4122_EXTERN static bool equals(const uuid_input& a, const uuid_input& b);

    /// Same as equals(*this, other)
    RFC4122_EXTERN bool equals(const uuid_input& other) const;

    /// -1, 0 or 1 by unsigned comparison of the bytes in index order.
    /// @throw format_error, invalid_input_error if an input does not parse
    RFC4122_EXTERN static int compare(const uuid_input& a, const uuid_input& b);

    /// Byte comparison of two uuids, used for the comparison operators
    RFC4122_EXTERN static int compare(const uuid& a, const uuid& b);

    /// Same as compare(*this, other)
    RFC4122_EXTERN int compare(const uuid_input& other) const;
    /// @}

    /// @name Formatting
    /// @{

    /// 32 lowercase hex digits, e.g. 9e472052a65446939a8b3ce57ada3d6c
    RFC4122_EXTERN std::string hex() const;

    /// RFC-4122 form: 8-4-4-4-12 lowercase hex digits separated by hyphens
    RFC4122_EXTERN std::string str() const;

    /// A copy of the 16 bytes
    RFC4122_EXTERN binary to_bytes() const;

    /// The 16 bytes
    const byte_array<SIZE>& bytes() const { return bytes_; }
    /// @}

  private:
    uuid();

    byte_array<SIZE> bytes_;

    // Lazily computed string forms, guarded by lock_.
    mutable std::mutex lock_;
    mutable std::string hex_;
    mutable std::string str_;
};

/// Prints the RFC-4122 form
RFC4122_EXTERN std::ostream& operator<<(std::ostream&, const uuid&);

} // rfc4122

#endif // RFC4122_UUID_HPP
