#ifndef RFC4122_CONFIG_HPP
#define RFC4122_CONFIG_HPP

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
/// @copybrief rfc4122::config

#include "./internal/export.hpp"
#include "./types_fwd.hpp"

#include <iosfwd>
#include <string>

namespace rfc4122 {

/// Library settings: logging and the random device.
///
/// Settings are plain values until apply() pushes them to
/// logger::default_logger() and random_source::default_source().
/// They can be set in code or read from a JSON file:
///
///     {
///       "log": { "level": "warning+", "subsystems": ["parse", "random"] },
///       "random": { "device": "/dev/urandom" }
///     }
///
/// "level" and "subsystems" each take a name or an array of names,
/// see logger::parse_level() and logger::parse_subsystem().
class
RFC4122_CLASS_EXTERN config {
  public:
    /// Defaults: no log levels, all subsystems, device "default"
    RFC4122_EXTERN config();

    /// Enabled log levels, a mask of logger::level
    RFC4122_EXTERN config& log_levels(uint16_t);
    RFC4122_EXTERN uint16_t log_levels() const;

    /// Enabled log subsystems, a mask of logger::subsystem
    RFC4122_EXTERN config& log_subsystems(uint16_t);
    RFC4122_EXTERN uint16_t log_subsystems() const;

    /// Token for the default system_random_source
    RFC4122_EXTERN config& random_device(const std::string&);
    RFC4122_EXTERN const std::string& random_device() const;

    /// Configure the default logger and the default random source.
    /// Logger masks are replaced, not merged.
    /// @throw error if the random device is not usable
    RFC4122_EXTERN void apply() const;

  private:
    uint16_t log_levels_;
    uint16_t log_subsystems_;
    std::string random_device_;
};

/// Read the configuration file, or use defaults if there is none,
/// and apply() it. Returns the applied settings.
///
/// @throw error if a file is found but cannot be parsed
RFC4122_EXTERN config apply_config();

/// Reading settings from JSON.
namespace config_file {

/// Parse settings from a JSON document.
/// @throw error if the document is not valid JSON or not a valid configuration
RFC4122_EXTERN config parse(std::istream& is);

/// Name of the configuration file to use.
///
/// If the environment variable RFC4122_CONFIG_FILE is set it is
/// returned. Otherwise the first existing file of:
///
/// - rfc4122.json in the current directory
/// - $HOME/.config/rfc4122/rfc4122.json
/// - <install prefix>/etc/rfc4122/rfc4122.json
/// - /etc/rfc4122/rfc4122.json
///
/// @throw error if no file exists
RFC4122_EXTERN std::string default_file();

/// Parse the default_file()
/// @throw error if there is no file or it cannot be parsed
RFC4122_EXTERN config parse_default();

} // config_file
} // rfc4122

#endif // RFC4122_CONFIG_HPP
