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

#include "rfc4122/error.hpp"
#include "rfc4122/uuid.hpp"
#include "rfc4122/uuid_input.hpp"

#include <ostream>

namespace rfc4122 {

namespace {
invalid_input_error make_input_error(uuid_input::input_type want, uuid_input::input_type got) {
    return invalid_input_error(MSG("unexpected input type, want: " << type_name(want) << " got: " << type_name(got)));
}
}

uuid_input::uuid_input() : type_(NULL_INPUT) {}

uuid_input::uuid_input(const null&) : type_(NULL_INPUT) {}

uuid_input::uuid_input(std::nullptr_t) : type_(NULL_INPUT) {}

uuid_input::uuid_input(const char* s) : type_(s ? STRING_INPUT : NULL_INPUT) {
    if (s) string_ = s;
}

uuid_input::uuid_input(const std::string& s) : type_(STRING_INPUT), string_(s) {}

uuid_input::uuid_input(const binary& b) : type_(BYTES_INPUT), bytes_(b) {}

uuid_input::uuid_input(const byte_array<16>& b) : type_(BYTES_INPUT), bytes_(b.begin(), b.end()) {}

uuid_input::uuid_input(const uuid& u) : type_(UUID_INPUT), bytes_(u.bytes().begin(), u.bytes().end()) {}

uuid_input::input_type uuid_input::type() const { return type_; }

bool uuid_input::empty() const { return type_ == NULL_INPUT; }

const std::string& uuid_input::string() const {
    if (type_ != STRING_INPUT) throw make_input_error(STRING_INPUT, type_);
    return string_;
}

const binary& uuid_input::bytes() const {
    if (type_ != BYTES_INPUT && type_ != UUID_INPUT) throw make_input_error(BYTES_INPUT, type_);
    return bytes_;
}

std::string type_name(uuid_input::input_type t) {
    switch (t) {
      case uuid_input::NULL_INPUT: return "null";
      case uuid_input::STRING_INPUT: return "string";
      case uuid_input::BYTES_INPUT: return "bytes";
      case uuid_input::UUID_INPUT: return "uuid";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& o, const uuid_input& x) {
    o << '[' << type_name(x.type()) << "] ";
    switch (x.type()) {
      case uuid_input::NULL_INPUT: return o << null();
      case uuid_input::STRING_INPUT: return o << '"' << x.string() << '"';
      case uuid_input::BYTES_INPUT:
      case uuid_input::UUID_INPUT: return o << x.bytes();
    }
    return o;
}

}
