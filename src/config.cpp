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
#include "msg.hpp"

#include "rfc4122/config.hpp"
#include "rfc4122/error.hpp"
#include "rfc4122/logger.hpp"
#include "rfc4122/random_source.hpp"

#include <json/value.h>
#include <json/reader.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#ifndef RFC4122_INSTALL_PREFIX
#define RFC4122_INSTALL_PREFIX ""
#endif

using namespace Json;
using std::string;

namespace {
const char *type_name(ValueType t) {
    switch (t) {
      case nullValue: return "null";
      case intValue: return "int";
      case uintValue: return "uint";
      case realValue: return "real";
      case stringValue: return "string";
      case booleanValue: return "boolean";
      case arrayValue: return "array";
      case objectValue: return "object";
      default: return "unknown";
    }
}
} // namespace

namespace std {
ostream& operator<<(ostream& o, ValueType t) { return o << type_name(t); }
}

namespace rfc4122 {

namespace {

rfc4122::error err(const string& message) {
    return rfc4122::error("configuration: " + message);
}

Value validate(ValueType t, const Value& v, const string& name) {
    if (v.type() != t)
        throw err(msg() << "'" << name << "' expected " << t << ", found " << v.type());
    return v;
}

Value get(ValueType t, const Value& obj, const char *key, const Value& dflt=Value()) {
    Value v = obj.get(key, dflt);
    return v.isNull() ? dflt : validate(t, v, key);
}

string get_string(const Value& obj, const char *key, const string& dflt) {
    return get(stringValue, obj, key, dflt).asString();
}

static const string HOME("HOME");
static const string ENV_VAR("RFC4122_CONFIG_FILE");
static const string FILE_NAME("rfc4122.json");
static const string HOME_FILE_NAME("/.config/rfc4122/" + FILE_NAME);
static const string ETC_FILE_NAME("/etc/rfc4122/" + FILE_NAME);

// A name or an array of names, each turned into a mask by parse_name and OR-ed.
uint16_t parse_names(const Value& v, const string& name, uint16_t (*parse_name)(const string&)) {
    try {
        switch (v.type()) {
          case stringValue:
            return parse_name(v.asString());
          case arrayValue: {
              uint16_t mask = 0;
              for (ArrayIndex i = 0; i < v.size(); ++i) {
                  Value e = v.get(i, Value());
                  validate(stringValue, e, name);
                  mask |= parse_name(e.asString());
              }
              return mask;
          }
          default:
            throw err(msg() << "'" << name << "' expected string or array, found " << v.type());
        }
    } catch (const rfc4122::error& e) {
        string what = e.what();
        if (what.compare(0, 15, "configuration: ") == 0) throw;
        throw err(msg() << "'" << name << "' " << what);
    }
}

void parse_log(const Value& root, config& c) {
    Value log = get(objectValue, root, "log");
    if (log.isNull()) return;
    Value level = log.get("level", Value());
    if (!level.isNull()) c.log_levels(parse_names(level, "log/level", logger::parse_level));
    Value subsystems = log.get("subsystems", Value());
    if (!subsystems.isNull()) c.log_subsystems(parse_names(subsystems, "log/subsystems", logger::parse_subsystem));
}

void parse_random(const Value& root, config& c) {
    Value random = get(objectValue, root, "random");
    if (random.isNull()) return;
    c.random_device(get_string(random, "device", c.random_device()));
}

config parse(const Value& root) {
    validate(objectValue, root, "configuration");
    config c;
    parse_log(root, c);
    parse_random(root, c);
    return c;
}

bool find_config_file(std::ifstream& f, string& name) {
    const char *env_path = getenv(ENV_VAR.c_str());
    const char *home = getenv(HOME.c_str());

    // Try environment variable if set
    if (env_path) {
        name = env_path;
        f.open(name.c_str());
        return f.good();
    }

    std::vector<string> path;
    // current directory
    path.push_back(FILE_NAME);
    // $HOME/.config/rfc4122/FILE_NAME
    if (home) path.push_back(home + HOME_FILE_NAME);
    // INSTALL_PREFIX/etc/rfc4122/FILE_NAME
    if (*RFC4122_INSTALL_PREFIX) path.push_back(RFC4122_INSTALL_PREFIX + ETC_FILE_NAME);

    for (unsigned i = 0; i < path.size(); ++i) {
        name = path[i];
        f.open(name.c_str());
        if (f.good()) return true;
        f.close();
    }

    /* /etc/rfc4122/FILE_NAME */
    name = ETC_FILE_NAME;
    f.open(name.c_str());
    return f.good();
}

config parse_file(std::ifstream& f, const string& name) {
    try {
        Value root;
        f >> root;
        f.close();
        return parse(root);
    } catch (const rfc4122::error&) {
        throw;
    } catch (const std::ifstream::failure& e) {
        throw err(msg() << "io error parsing '" << name << "': " << e.what());
    } catch (const std::exception& e) {
        throw err(msg() << "error parsing '" << name << "': " << e.what());
    }
}

} // namespace

config::config() :
    log_levels_(logger::LEVEL_NONE), log_subsystems_(logger::SUBSYSTEM_ALL), random_device_("default")
{}

config& config::log_levels(uint16_t x) { log_levels_ = x; return *this; }
uint16_t config::log_levels() const { return log_levels_; }

config& config::log_subsystems(uint16_t x) { log_subsystems_ = x; return *this; }
uint16_t config::log_subsystems() const { return log_subsystems_; }

config& config::random_device(const string& x) { random_device_ = x; return *this; }
const string& config::random_device() const { return random_device_; }

void config::apply() const {
    if (random_device_ != random_source::default_token())
        random_source::set_default_token(random_device_);
    logger& l = logger::default_logger();
    l.reset_mask(logger::SUBSYSTEM_ALL, logger::LEVEL_ALL);
    l.set_mask(log_subsystems_, log_levels_);
}

config apply_config() {
    string name;
    std::ifstream f;
    config c;
    if (find_config_file(f, name)) {
        c = parse_file(f, name);
        c.apply();
        RFC4122_LOG(SUBSYSTEM_CONFIG, LEVEL_INFO, "applied configuration '" << name << "'");
    } else {
        c.apply();
        RFC4122_LOG(SUBSYSTEM_CONFIG, LEVEL_DEBUG, "no configuration file, last tried '" << name << "'");
    }
    return c;
}

namespace config_file {

config parse(std::istream& is) {
    try {
        Value root;
        is >> root;
        return rfc4122::parse(root);
    } catch (const rfc4122::error&) {
        throw;
    } catch (const std::exception& e) {
        throw err(e.what());
    }
}

string default_file() {
    string name;
    std::ifstream f;
    bool good = find_config_file(f, name);
    f.close();
    if (good) {
        return name;
    }
    throw err("no default configuration, last tried: " + name);
}

config parse_default() {
    string name;
    std::ifstream f;
    bool good = find_config_file(f, name);
    if (!good) {
        throw err("no default configuration, last tried: " + name);
    }
    return parse_file(f, name);
}

}} // namespace rfc4122::config_file
