#ifndef RFC4122_TYPES_FWD_HPP
#define RFC4122_TYPES_FWD_HPP

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
/// Forward declarations for rfc4122 types.

#include <cstddef>
#include <stdint.h>

namespace rfc4122 {

class binary;
class null;
class uuid;
class uuid_input;
class random_source;
class logger;
class config;
template <size_t N> class byte_array;

} // rfc4122

#endif // RFC4122_TYPES_FWD_HPP
