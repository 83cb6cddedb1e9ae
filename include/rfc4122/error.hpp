#ifndef RFC4122_ERROR_HPP
#define RFC4122_ERROR_HPP

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
/// @copybrief rfc4122::error

#include "./internal/export.hpp"

#include <stdexcept>
#include <string>

namespace rfc4122 {

/// The base rfc4122 error.
///
/// All exceptions thrown from functions in the rfc4122 namespace are
/// subclasses of rfc4122::error.
struct
RFC4122_CLASS_EXTERN error : public std::runtime_error {
    RFC4122_EXTERN explicit error(const std::string&); ///< Construct with message
};

/// Raised if a string or byte sequence has the wrong length or does
/// not match the required pattern.
struct
RFC4122_CLASS_EXTERN format_error : public error {
    RFC4122_EXTERN explicit format_error(const std::string&); ///< Construct with message
};

/// Raised if an input is of an unsupported shape, for example null
/// or a JSON number. The message describes the offending value.
struct
RFC4122_CLASS_EXTERN invalid_input_error : public error {
    RFC4122_EXTERN explicit invalid_input_error(const std::string&); ///< Construct with message
};

/// Raised if a function is called with arguments that violate its
/// usage, independent of any single uuid, such as fewer than two
/// inputs to uuid::equals.
struct
RFC4122_CLASS_EXTERN invalid_argument_error : public error {
    RFC4122_EXTERN explicit invalid_argument_error(const std::string&); ///< Construct with message
};

} // rfc4122

#endif // RFC4122_ERROR_HPP
