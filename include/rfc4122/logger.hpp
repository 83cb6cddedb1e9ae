#ifndef RFC4122_LOGGER_HPP
#define RFC4122_LOGGER_HPP

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
/// @copybrief rfc4122::logger

#include "./internal/export.hpp"
#include "./types_fwd.hpp"

#include <mutex>
#include <string>

namespace rfc4122 {

/// Facility for logging messages from the library.
///
/// Each message has a level, how important it is, and a subsystem,
/// which part of the library produced it. A logger has a mask of
/// enabled levels and a mask of enabled subsystems. A message is
/// emitted if its level is LEVEL_CRITICAL, or if both its level and its
/// subsystem are enabled.
///
/// Messages are passed to a sink function. The default sink writes
/// them to standard error. Initially every subsystem is enabled and
/// no level is, so only LEVEL_CRITICAL messages appear.
///
/// The library logs through default_logger(). It can be configured
/// in code or through the configuration file, see config.
class
RFC4122_CLASS_EXTERN logger {
  public:
    /// Severity of a message. Exclusive bits so that several can be
    /// combined into a mask.
    enum level {
        LEVEL_NONE     = 0,    ///< No level
        LEVEL_CRITICAL = 1,    ///< Something is wrong and can't be fixed
        LEVEL_ERROR    = 2,    ///< Something went wrong
        LEVEL_WARNING  = 4,    ///< Something unusual happened but not necessarily an error
        LEVEL_INFO     = 8,    ///< Something that might be interesting happened
        LEVEL_DEBUG    = 16,   ///< Something you might want to know about happened
        LEVEL_TRACE    = 32,   ///< Detail about something that happened
        LEVEL_ALL      = 65535 ///< Every possible level
    };

    /// Part of the library producing a message. Exclusive bits.
    enum subsystem {
        SUBSYSTEM_NONE   = 0,     ///< No subsystem
        SUBSYSTEM_CODEC  = 1,     ///< Hex and byte conversion
        SUBSYSTEM_PARSE  = 2,     ///< Parsing input into a uuid
        SUBSYSTEM_RANDOM = 4,     ///< Random bytes and v4 generation
        SUBSYSTEM_CONFIG = 8,     ///< Configuration loading
        SUBSYSTEM_ALL    = 65535  ///< Every subsystem
    };

    /// Receives every emitted message. context is the value given to set_sink().
    typedef void (*sink_fn)(intptr_t context, subsystem, level, const char* message);

    /// A logger with every subsystem enabled, no level enabled and the
    /// default sink.
    RFC4122_EXTERN logger();

    /// The process-wide logger used by the library
    RFC4122_EXTERN static logger& default_logger();

    /// Enable the given subsystem and level bits. Bits not set in the
    /// arguments are unchanged.
    RFC4122_EXTERN void set_mask(uint16_t subsystems, uint16_t levels);

    /// Disable the given subsystem and level bits.
    RFC4122_EXTERN void reset_mask(uint16_t subsystems, uint16_t levels);

    /// Currently enabled levels
    RFC4122_EXTERN uint16_t level_mask() const;

    /// Currently enabled subsystems
    RFC4122_EXTERN uint16_t subsystem_mask() const;

    /// Send messages to sink instead. A null sink restores the default.
    RFC4122_EXTERN void set_sink(sink_fn sink, intptr_t context=0);

    /// True if a message with this subsystem and level would be emitted
    RFC4122_EXTERN bool enabled(subsystem, level) const;

    /// Emit message if enabled(s, l)
    RFC4122_EXTERN void log(subsystem s, level l, const std::string& message);

    /// Readable name of a single level, e.g. "debug"
    RFC4122_EXTERN static const char* level_name(level);

    /// Readable name of a single subsystem, e.g. "parse"
    RFC4122_EXTERN static const char* subsystem_name(subsystem);

    /// Level mask for a name. "debug" gives LEVEL_DEBUG, "debug+" gives
    /// LEVEL_DEBUG and every more severe level, "all" and "none" the obvious.
    /// @throw error for an unknown name
    RFC4122_EXTERN static uint16_t parse_level(const std::string& name);

    /// Subsystem mask for a name, including "all" and "none".
    /// @throw error for an unknown name
    RFC4122_EXTERN static uint16_t parse_subsystem(const std::string& name);

  private:
    logger(const logger&);
    logger& operator=(const logger&);

    mutable std::mutex lock_;
    sink_fn sink_;
    intptr_t sink_context_;
    uint16_t sub_mask_;
    uint16_t sev_mask_;
};

} // rfc4122

#endif // RFC4122_LOGGER_HPP
