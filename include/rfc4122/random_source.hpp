#ifndef RFC4122_RANDOM_SOURCE_HPP
#define RFC4122_RANDOM_SOURCE_HPP

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
/// @copybrief rfc4122::random_source

#include "./internal/export.hpp"
#include "./types_fwd.hpp"

#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace rfc4122 {

/// A source of random bytes for uuid::v4().
///
/// Subclass to supply bytes from somewhere other than the platform
/// random device, for example a hardware generator or a fixed
/// sequence in tests.
class
RFC4122_CLASS_EXTERN random_source {
  public:
    RFC4122_EXTERN virtual ~random_source();

    /// Fill n bytes at p with random data.
    /// @throw error if the source cannot produce the bytes
    virtual void fill(uint8_t* p, size_t n) = 0;

    /// The process-wide source used by uuid::v4(), a
    /// system_random_source. Safe to use from several threads.
    RFC4122_EXTERN static random_source& default_source();

    /// Replace the default source with a system_random_source using
    /// token, see system_random_source.
    /// @throw error if token does not name a usable device
    RFC4122_EXTERN static void set_default_token(const std::string& token);

    /// Token the default source was created with
    RFC4122_EXTERN static std::string default_token();
};

/// Random bytes from the operating system via std::random_device.
///
/// The token selects the device, e.g. "default", "/dev/urandom",
/// "rdrand". Which tokens work depends on the platform and the C++
/// runtime.
class
RFC4122_CLASS_EXTERN system_random_source : public random_source {
  public:
    /// @throw error if token does not name a usable device
    RFC4122_EXTERN explicit system_random_source(const std::string& token="default");
    RFC4122_EXTERN ~system_random_source();

    /// Thread safe
    RFC4122_EXTERN void fill(uint8_t* p, size_t n);

    /// The device token
    RFC4122_EXTERN const std::string& token() const;

  private:
    std::string token_;
    std::mutex lock_;
    std::unique_ptr<std::random_device> device_;
};

} // rfc4122

#endif // RFC4122_RANDOM_SOURCE_HPP
