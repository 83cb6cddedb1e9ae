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
#include "rfc4122/json.hpp"
#include "rfc4122/uuid.hpp"

#include <json/writer.h>

namespace rfc4122 {
namespace json {

namespace {

const char *type_name(Json::ValueType t) {
    switch (t) {
      case Json::nullValue: return "null";
      case Json::intValue: return "int";
      case Json::uintValue: return "uint";
      case Json::realValue: return "real";
      case Json::stringValue: return "string";
      case Json::booleanValue: return "boolean";
      case Json::arrayValue: return "array";
      case Json::objectValue: return "object";
      default: return "unknown";
    }
}

// Type and compact text of v, e.g. [object] {"a":1}
std::string describe(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return MSG("[" << type_name(v.type()) << "] " << Json::writeString(builder, v));
}

// False if an element is not an integer in 0-255.
bool array_bytes(const Json::Value& v, binary& bytes) {
    bytes.clear();
    for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
        const Json::Value& e = v[i];
        if (!e.isInt() || e.asInt() < 0 || e.asInt() > 255) return false;
        bytes.push_back(uint8_t(e.asInt()));
    }
    return true;
}

} // namespace

Json::Value to_json(const uuid& u) { return Json::Value(u.str()); }

uuid from_json(const Json::Value& v) {
    switch (v.type()) {
      case Json::stringValue:
        return uuid::from(v.asString());
      case Json::arrayValue: {
          binary bytes;
          if (!array_bytes(v, bytes))
              throw format_error(MSG("invalid byte array, expected integers 0-255: " << describe(v)));
          return uuid::from(bytes);
      }
      default:
        throw invalid_input_error(MSG("invalid input received: " << describe(v)));
    }
}

bool is_valid(const Json::Value& v) {
    switch (v.type()) {
      case Json::stringValue:
        return uuid::is_valid(v.asString());
      case Json::arrayValue: {
          binary bytes;
          return array_bytes(v, bytes) && uuid::is_valid(bytes);
      }
      default:
        return false;
    }
}

}}
