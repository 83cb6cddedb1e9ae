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

#include "options.hpp"

#include <rfc4122/config.hpp>
#include <rfc4122/json.hpp>
#include <rfc4122/uuid.hpp>

#include <json/value.h>
#include <json/writer.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

using rfc4122::uuid;

struct tool_options {
    int count;
    bool hex;
    bool validate;
    bool sort;
    bool equal;
    bool json;

    tool_options() : count(1), hex(), validate(), sort(), equal(), json() {}

    std::string form(const uuid& u) const { return hex ? u.hex() : u.str(); }
};

void print_json(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, v) << std::endl;
}

int generate(const tool_options& o) {
    Json::Value results(Json::arrayValue);
    for (int i = 0; i < o.count; ++i) {
        uuid u = uuid::v4();
        if (o.json) results.append(o.hex ? Json::Value(u.hex()) : rfc4122::json::to_json(u));
        else std::cout << o.form(u) << std::endl;
    }
    if (o.json) print_json(results);
    return 0;
}

int validate(const tool_options& o, const std::vector<std::string>& inputs) {
    Json::Value results(Json::arrayValue);
    int status = 0;
    for (size_t i = 0; i < inputs.size(); ++i) {
        bool valid = uuid::is_valid(inputs[i]);
        if (!valid) status = 1;
        if (o.json) {
            Json::Value v(Json::objectValue);
            v["input"] = inputs[i];
            v["valid"] = valid;
            results.append(v);
        } else std::cout << inputs[i] << ": " << (valid ? "valid" : "invalid") << std::endl;
    }
    if (o.json) print_json(results);
    return status;
}

int equal(const tool_options& o, const std::vector<std::string>& inputs) {
    std::vector<rfc4122::uuid_input> values(inputs.begin(), inputs.end());
    bool result = uuid::equals(values);
    if (o.json) print_json(Json::Value(result));
    else std::cout << (result ? "equal" : "not equal") << std::endl;
    return 0;
}

int show(const tool_options& o, const std::vector<std::string>& inputs) {
    std::vector<uuid> ids;
    for (size_t i = 0; i < inputs.size(); ++i)
        ids.push_back(uuid::from(inputs[i]));
    if (o.sort) std::sort(ids.begin(), ids.end());

    Json::Value results(Json::arrayValue);
    for (size_t i = 0; i < ids.size(); ++i) {
        if (o.json) {
            Json::Value v(Json::objectValue);
            v["uuid"] = o.form(ids[i]);
            v["version"] = ids[i].version();
            results.append(v);
        } else if (o.sort) {
            std::cout << o.form(ids[i]) << std::endl;
        } else {
            std::cout << o.form(ids[i]) << " version " << ids[i].version() << std::endl;
        }
    }
    if (o.json) print_json(results);
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    tool_options o;
    example::options opts(argc, argv, "[UUID...]");
    opts.add_value(o.count, 'c', "count", "generate COUNT random UUIDs when no UUID is given", "COUNT");
    opts.add_flag(o.hex, 'x', "hex", "print 32 digit hex instead of the hyphenated form");
    opts.add_flag(o.validate, 'v', "validate", "report whether each UUID is valid, exit 1 if any is not");
    opts.add_flag(o.sort, 's', "sort", "print the UUIDs in ascending order");
    opts.add_flag(o.equal, 'e', "equal", "report whether all UUIDs are equal");
    opts.add_flag(o.json, 'j', "json", "print results as JSON");
    try {
        opts.parse();
        rfc4122::apply_config();
        const std::vector<std::string>& inputs = opts.operands();
        if (o.validate) return validate(o, inputs);
        if (o.equal) return equal(o, inputs);
        if (inputs.empty()) return generate(o);
        return show(o, inputs);
    } catch (const example::bad_option& e) {
        std::cout << opts << std::endl << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
    }
    return 1;
}
