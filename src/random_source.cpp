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

#include "rfc4122/error.hpp"
#include "rfc4122/random_source.hpp"

namespace rfc4122 {

namespace {

struct default_state {
    std::mutex lock;
    std::string token;
    std::shared_ptr<system_random_source> device;

    default_state() : token("default") {}
};

default_state& state() {
    static default_state s;
    return s;
}

std::shared_ptr<system_random_source> current_device() {
    default_state& s = state();
    std::lock_guard<std::mutex> l(s.lock);
    if (!s.device) s.device = std::make_shared<system_random_source>(s.token);
    return s.device;
}

// Forwards to the current default device, so set_default_token() can
// replace the device while callers still hold default_source().
class default_random_source : public random_source {
  public:
    void fill(uint8_t* p, size_t n) { current_device()->fill(p, n); }
};

} // namespace

random_source::~random_source() {}

random_source& random_source::default_source() {
    static default_random_source source;
    return source;
}

void random_source::set_default_token(const std::string& token) {
    std::shared_ptr<system_random_source> device = std::make_shared<system_random_source>(token);
    default_state& s = state();
    std::lock_guard<std::mutex> l(s.lock);
    s.token = token;
    s.device = device;
}

std::string random_source::default_token() {
    default_state& s = state();
    std::lock_guard<std::mutex> l(s.lock);
    return s.token;
}

system_random_source::system_random_source(const std::string& token) : token_(token) {
    try {
        device_.reset(new std::random_device(token));
    } catch (const std::exception& e) {
        RFC4122_LOG(SUBSYSTEM_RANDOM, LEVEL_ERROR, "random device '" << token << "' not available: " << e.what());
        throw error(MSG("random device '" << token << "' not available: " << e.what()));
    }
    RFC4122_LOG(SUBSYSTEM_RANDOM, LEVEL_DEBUG, "opened random device '" << token << "'");
}

system_random_source::~system_random_source() {}

void system_random_source::fill(uint8_t* p, size_t n) {
    std::lock_guard<std::mutex> l(lock_);
    try {
        size_t i = 0;
        while (i < n) {
            std::random_device::result_type r = (*device_)();
            for (size_t j = 0; j < sizeof(r) && i < n; ++j, ++i) {
                p[i] = uint8_t(r & 0xff);
                r >>= 8;
            }
        }
    } catch (const std::exception& e) {
        throw error(MSG("random device '" << token_ << "' failed: " << e.what()));
    }
}

const std::string& system_random_source::token() const { return token_; }

}
