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
#include "rfc4122/logger.hpp"

#include <cstdio>

namespace rfc4122 {

namespace {

void stderr_sink(intptr_t, logger::subsystem s, logger::level l, const char* message) {
    std::fprintf(stderr, "[%s]:%s:%s\n", logger::subsystem_name(s), logger::level_name(l), message);
}

struct name_bits { const char* name; uint16_t bits; };

const name_bits level_names[] = {
    { "none", logger::LEVEL_NONE },
    { "critical", logger::LEVEL_CRITICAL },
    { "error", logger::LEVEL_ERROR },
    { "warning", logger::LEVEL_WARNING },
    { "info", logger::LEVEL_INFO },
    { "debug", logger::LEVEL_DEBUG },
    { "trace", logger::LEVEL_TRACE },
    { "all", logger::LEVEL_ALL }
};

const name_bits subsystem_names[] = {
    { "none", logger::SUBSYSTEM_NONE },
    { "codec", logger::SUBSYSTEM_CODEC },
    { "parse", logger::SUBSYSTEM_PARSE },
    { "random", logger::SUBSYSTEM_RANDOM },
    { "config", logger::SUBSYSTEM_CONFIG },
    { "all", logger::SUBSYSTEM_ALL }
};

template <size_t N>
const char* find_name(const name_bits (&names)[N], uint16_t bits) {
    for (size_t i = 0; i < N; ++i)
        if (names[i].bits == bits) return names[i].name;
    return "unknown";
}

template <size_t N>
bool find_bits(const name_bits (&names)[N], const std::string& name, uint16_t& bits) {
    for (size_t i = 0; i < N; ++i) {
        if (name == names[i].name) {
            bits = names[i].bits;
            return true;
        }
    }
    return false;
}

} // namespace

logger::logger() :
    sink_(stderr_sink), sink_context_(0), sub_mask_(SUBSYSTEM_ALL), sev_mask_(LEVEL_NONE)
{}

logger& logger::default_logger() {
    static logger l;
    return l;
}

void logger::set_mask(uint16_t subsystems, uint16_t levels) {
    std::lock_guard<std::mutex> l(lock_);
    sub_mask_ |= subsystems;
    sev_mask_ |= levels;
}

void logger::reset_mask(uint16_t subsystems, uint16_t levels) {
    std::lock_guard<std::mutex> l(lock_);
    sub_mask_ &= ~subsystems;
    sev_mask_ &= ~levels;
}

uint16_t logger::level_mask() const {
    std::lock_guard<std::mutex> l(lock_);
    return sev_mask_;
}

uint16_t logger::subsystem_mask() const {
    std::lock_guard<std::mutex> l(lock_);
    return sub_mask_;
}

void logger::set_sink(sink_fn sink, intptr_t context) {
    std::lock_guard<std::mutex> l(lock_);
    sink_ = sink ? sink : stderr_sink;
    sink_context_ = sink ? context : 0;
}

bool logger::enabled(subsystem s, level l) const {
    if (l & LEVEL_CRITICAL) return true;
    std::lock_guard<std::mutex> g(lock_);
    return (sub_mask_ & s) && (sev_mask_ & l);
}

void logger::log(subsystem s, level l, const std::string& message) {
    sink_fn sink;
    intptr_t context;
    {
        std::lock_guard<std::mutex> g(lock_);
        if (!(l & LEVEL_CRITICAL) && !((sub_mask_ & s) && (sev_mask_ & l))) return;
        sink = sink_;
        context = sink_context_;
    }
    sink(context, s, l, message.c_str());
}

const char* logger::level_name(level l) { return find_name(level_names, l); }

const char* logger::subsystem_name(subsystem s) { return find_name(subsystem_names, s); }

uint16_t logger::parse_level(const std::string& name) {
    const bool and_above = !name.empty() && name[name.size()-1] == '+';
    const std::string base = and_above ? name.substr(0, name.size()-1) : name;
    uint16_t bits = 0;
    if (!find_bits(level_names, base, bits))
        throw error(MSG("unknown log level '" << name << "'"));
    if (and_above) {
        if (bits == LEVEL_NONE || bits == LEVEL_ALL)
            throw error(MSG("unknown log level '" << name << "'"));
        bits = uint16_t((bits << 1) - 1); // This level and every lower, more severe, bit
    }
    return bits;
}

uint16_t logger::parse_subsystem(const std::string& name) {
    uint16_t bits = 0;
    if (!find_bits(subsystem_names, name, bits))
        throw error(MSG("unknown log subsystem '" << name << "'"));
    return bits;
}

}
