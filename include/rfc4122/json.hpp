#ifndef RFC4122_JSON_HPP
#define RFC4122_JSON_HPP

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
/// JSON conversion of uuids using jsoncpp.

#include "./internal/export.hpp"
#include "./types_fwd.hpp"

#include <json/value.h>

namespace rfc4122 {
namespace json {

/// A JSON string holding the RFC-4122 form of u
RFC4122_EXTERN Json::Value to_json(const uuid& u);

/// Convert a JSON value to a uuid.
///
/// A string is parsed as by uuid::from(). An array of 16 integers in
/// 0-255 is treated as raw bytes.
///
/// @throw invalid_input_error for null or any other JSON type; the
/// message names the type and shows the value.
/// @throw format_error if a string or array does not parse.
RFC4122_EXTERN uuid from_json(const Json::Value& v);

/// True if from_json(v) would succeed and give a valid uuid, see
/// uuid::is_valid(). Never throws.
RFC4122_EXTERN bool is_valid(const Json::Value& v);

} // json
} // rfc4122

#endif // RFC4122_JSON_HPP
