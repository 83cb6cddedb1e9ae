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

#include "rfc4122/codec.hpp"
#include "rfc4122/error.hpp"
#include "rfc4122/random_source.hpp"
#include "rfc4122/uuid.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>

namespace rfc4122 {

const size_t uuid::SIZE;
const size_t uuid::STRING_LENGTH;
const size_t uuid::HEX_LENGTH;

namespace {

typedef byte_array<uuid::SIZE> uuid_bytes;

bool is_hyphen_position(size_t i) { return i == 8 || i == 13 || i == 18 || i == 23; }

bool is_variant_digit(char c) {
    return c == '8' || c == '9' || c == 'a' || c == 'b' || c == 'A' || c == 'B';
}

// Strict check of the RFC-4122 form (hyphenated) or the hex form:
// hex digits everywhere except the hyphens, version digit 1-5 and
// variant digit 8, 9, a or b.
bool matches_form(const std::string& s, bool hyphenated) {
    const size_t length = hyphenated ? uuid::STRING_LENGTH : uuid::HEX_LENGTH;
    const size_t version_at = hyphenated ? 14 : 12;
    const size_t variant_at = hyphenated ? 19 : 16;
    if (s.size() != length) return false;
    for (size_t i = 0; i < length; ++i) {
        const char c = s[i];
        if (hyphenated && is_hyphen_position(i)) {
            if (c != '-') return false;
        } else if (i == version_at) {
            if (c < '1' || c > '5') return false;
        } else if (i == variant_at) {
            if (!is_variant_digit(c)) return false;
        } else if (!codec::is_hex_digit(c)) {
            return false;
        }
    }
    return true;
}

// Version 1-5 in the high nibble of byte 6, variant bits 10 at the top of byte 8.
bool valid_bytes(const uint8_t* p) {
    const int version = p[6] >> 4;
    return version >= 1 && version <= 5 && (p[8] & 0xc0) == 0x80;
}

std::string strip_hyphens(const std::string& s) {
    std::string hex;
    hex.reserve(uuid::HEX_LENGTH);
    std::remove_copy(s.begin(), s.end(), std::back_inserter(hex), '-');
    return hex;
}

// Hyphens after hex digits 8, 12, 16 and 20.
std::string insert_hyphens(const std::string& hex) {
    std::string s;
    s.reserve(uuid::STRING_LENGTH);
    s.append(hex, 0, 8).append(1, '-');
    s.append(hex, 8, 4).append(1, '-');
    s.append(hex, 12, 4).append(1, '-');
    s.append(hex, 16, 4).append(1, '-');
    s.append(hex, 20, 12);
    return s;
}

uuid_bytes parse_hex(const std::string& hex) {
    if (!matches_form(hex, false)) {
        RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "rejected hex string of length " << hex.size());
        throw format_error(MSG("invalid hex uuid string: \"" << hex << '"'));
    }
    return codec::hex_to_bytes(hex);
}

uuid_bytes parse_string(const std::string& s) {
    if (!matches_form(s, true)) {
        RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "rejected RFC-4122 string of length " << s.size());
        throw format_error(MSG("invalid RFC-4122 string: \"" << s << '"'));
    }
    return codec::hex_to_bytes(strip_hyphens(s));
}

uuid_bytes parse_bytes(const uint8_t* p, size_t n) {
    if (n != uuid::SIZE) {
        RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "rejected byte sequence of length " << n);
        throw format_error(MSG("invalid byte length, expected " << uuid::SIZE << " got " << n));
    }
    if (!p) throw invalid_input_error("invalid input received: null byte pointer");
    return uuid_bytes(p);
}

uuid_bytes parse_bytes(const binary& b) {
    return parse_bytes(b.empty() ? 0 : &b[0], b.size());
}

uuid_bytes parse(const uuid_input& input) {
    switch (input.type()) {
      case uuid_input::STRING_INPUT: {
          const std::string& s = input.string();
          switch (s.size()) {
            case uuid::STRING_LENGTH: return parse_string(s);
            case uuid::HEX_LENGTH: return parse_hex(s);
            default:
              RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "rejected string of length " << s.size());
              throw format_error(MSG("invalid length " << s.size() << ", expected "
                                     << uuid::STRING_LENGTH << " or " << uuid::HEX_LENGTH));
          }
      }
      case uuid_input::BYTES_INPUT:
        return parse_bytes(input.bytes());
      case uuid_input::UUID_INPUT:
        return uuid_bytes(&input.bytes()[0]);
      case uuid_input::NULL_INPUT:
        break;
    }
    RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "rejected input " << input);
    throw invalid_input_error(MSG("invalid input received: " << input));
}

} // namespace

uuid::uuid() {}

uuid::uuid(const uuid_input& input) : bytes_(parse(input)) {}

uuid::uuid(const uuid& x) : bytes_(x.bytes_) {}

uuid& uuid::operator=(const uuid& x) {
    if (this != &x) {
        std::lock_guard<std::mutex> l(lock_);
        bytes_ = x.bytes_;
        hex_.clear();
        str_.clear();
    }
    return *this;
}

uuid uuid::from(const uuid_input& input) { return uuid(input); }

uuid uuid::from_hex(const std::string& hex) {
    uuid u;
    u.bytes_ = parse_hex(hex);
    return u;
}

uuid uuid::from_string(const std::string& s) {
    uuid u;
    u.bytes_ = parse_string(s);
    return u;
}

uuid uuid::from_bytes(const binary& b) {
    uuid u;
    u.bytes_ = parse_bytes(b);
    return u;
}

uuid uuid::from_bytes(const uint8_t* p, size_t n) {
    uuid u;
    u.bytes_ = parse_bytes(p, n);
    return u;
}

uuid uuid::nil() { return uuid(); }

uuid uuid::max() {
    uuid u;
    u.bytes_ = uuid_bytes(0xff);
    return u;
}

uuid uuid::v4() { return v4(random_source::default_source()); }

uuid uuid::v4(random_source& source) {
    uuid_bytes bytes;
    source.fill(bytes.begin(), bytes.size());

    // From RFC4122, the version bits are set to 0100
    bytes[6] = (bytes[6] & 0x0F) | 0x40;

    // From RFC4122, the top two bits of byte 8 get set to 10
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    // Generated text is checked by the same parser as any other string.
    const std::string s = insert_hyphens(codec::bytes_to_hex(bytes));
    RFC4122_LOG(SUBSYSTEM_RANDOM, LEVEL_TRACE, "generated v4 " << s);
    return from_string(s);
}

bool uuid::is_valid_hex(const std::string& hex) { return matches_form(hex, false); }

bool uuid::is_valid_string(const std::string& s) { return matches_form(s, true); }

bool uuid::is_valid_bytes(const binary& b) {
    return b.size() == SIZE && valid_bytes(&b[0]);
}

bool uuid::is_valid(const uuid_input& input) {
    switch (input.type()) {
      case uuid_input::STRING_INPUT: {
          const std::string& s = input.string();
          switch (s.size()) {
            case STRING_LENGTH: return is_valid_string(s);
            case HEX_LENGTH: return is_valid_hex(s);
            default: return false;
          }
      }
      case uuid_input::BYTES_INPUT:
      case uuid_input::UUID_INPUT:
        return is_valid_bytes(input.bytes());
      case uuid_input::NULL_INPUT:
        break;
    }
    return false;
}

int uuid::version(const uuid_input& input) {
    if (input.type() == uuid_input::BYTES_INPUT) {
        const binary& b = input.bytes();
        if (b.size() != SIZE)
            throw format_error(MSG("invalid byte length, expected " << SIZE << " got " << b.size()));
        return b[6] >> 4;
    }
    return parse(input)[6] >> 4;
}

int uuid::version() const { return bytes_[6] >> 4; }

bool uuid::equals(const std::vector<uuid_input>& inputs) {
    if (inputs.size() < 2)
        throw invalid_argument_error(MSG("at least two inputs required for equals, got " << inputs.size()));
    if (inputs[0].empty()) return false;
    const uuid_bytes ref = parse(inputs[0]);
    for (size_t i = 1; i < inputs.size(); ++i) {
        if (inputs[i].empty()) return false;
        if (uuid_bytes::compare(ref, parse(inputs[i])) != 0) return false;
    }
    return true;
}

bool uuid::equals(const uuid_input& a, const uuid_input& b) {
    std::vector<uuid_input> inputs;
    inputs.push_back(a);
    inputs.push_back(b);
    return equals(inputs);
}

bool uuid::equals(const uuid_input& other) const { return equals(uuid_input(*this), other); }

int uuid::compare(const uuid_input& a, const uuid_input& b) {
    return uuid_bytes::compare(parse(a), parse(b));
}

int uuid::compare(const uuid& a, const uuid& b) { return uuid_bytes::compare(a.bytes_, b.bytes_); }

int uuid::compare(const uuid_input& other) const { return compare(uuid_input(*this), other); }

std::string uuid::hex() const {
    std::lock_guard<std::mutex> l(lock_);
    if (hex_.empty()) hex_ = codec::bytes_to_hex(bytes_);
    return hex_;
}

std::string uuid::str() const {
    std::lock_guard<std::mutex> l(lock_);
    if (str_.empty()) {
        if (hex_.empty()) hex_ = codec::bytes_to_hex(bytes_);
        str_ = insert_hyphens(hex_);
    }
    return str_;
}

binary uuid::to_bytes() const { return binary(bytes_.begin(), bytes_.end()); }

/// UUID standard format: 8-4-4-4-12 (36 chars, 32 alphanumeric and 4 hyphens)
std::ostream& operator<<(std::ostream& o, const uuid& u) { return o << u.str(); }

}
