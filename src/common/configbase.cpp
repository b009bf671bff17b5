// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <strings.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

#define __IN_CONFIGBASE_CPP__
#include "common/config.h"
#undef __IN_CONFIGBASE_CPP__

#include <fmt/format.h>

#include "common/status.h"

namespace strata::config {

static const char* const kWhiteSpace = " \t\r\n";

static std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(kWhiteSpace);
    if (b == std::string::npos) {
        return {};
    }
    return s.substr(b, s.find_last_not_of(kWhiteSpace) - b + 1);
}

// Expand every ${NAME} of |value| from the environment.
static Status expand_env(std::string* value) {
    std::string out;
    size_t pos = 0;
    while (true) {
        const size_t open = value->find("${", pos);
        if (open == std::string::npos) {
            break;
        }
        const size_t close = value->find('}', open + 2);
        if (close == std::string::npos) {
            return Status::InvalidArgument(fmt::format("unterminated variable in '{}'", *value));
        }
        const std::string name = value->substr(open + 2, close - open - 2);
        const char* env = std::getenv(name.c_str());
        if (env == nullptr) {
            return Status::InvalidArgument(fmt::format("environment variable {} is not set", name));
        }
        out.append(*value, pos, open - pos).append(env);
        pos = close + 1;
    }
    out.append(*value, pos, std::string::npos);
    value->swap(out);
    return Status::OK();
}

bool strtox(const std::string& valstr, bool& retval) {
    if (strcasecmp(valstr.c_str(), "true") == 0 || valstr == "1") {
        retval = true;
        return true;
    }
    if (strcasecmp(valstr.c_str(), "false") == 0 || valstr == "0") {
        retval = false;
        return true;
    }
    return false;
}

bool strtox(const std::string& valstr, int32_t& retval) {
    if (valstr.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const long long v = strtoll(valstr.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT32_MIN || v > INT32_MAX) {
        return false;
    }
    retval = static_cast<int32_t>(v);
    return true;
}

bool strtox(const std::string& valstr, double& retval) {
    if (valstr.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const double v = strtod(valstr.c_str(), &end);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    retval = v;
    return true;
}

bool strtox(const std::string& valstr, std::string& retval) {
    retval = valstr;
    return true;
}

EnumField::EnumField(const char* name, std::string* storage, const char* defval, const char* enums,
                     bool valmutable)
        : Field("std::string", name, defval, valmutable), _storage(storage) {
    std::vector<std::string> values;
    strtox(enums, values);
    _enums.insert(values.begin(), values.end());
}

bool EnumField::parse_value(const std::string& valstr) {
    if (_enums.count(valstr) == 0) {
        return false;
    }
    *_storage = valstr;
    return true;
}

Field* Field::get(const std::string& name) {
    auto it = fields().find(name);
    return it == fields().end() ? nullptr : it->second;
}

bool Field::set_value(std::string value) {
    if (!expand_env(&value).ok()) {
        return false;
    }
    value = trim(value);
    if (!parse_value(value)) {
        return false;
    }
    _last_set_val = std::move(_current_set_val);
    _current_set_val = std::move(value);
    return true;
}

bool Field::rollback() {
    if (!parse_value(_last_set_val)) {
        return false;
    }
    _current_set_val = std::move(_last_set_val);
    _last_set_val.clear();
    return true;
}

// One "key = value" line. Blank lines and '#' comments are skipped, unknown keys
// are reported and skipped.
static bool apply_line(const std::string& raw, std::set<Field*>* assigned) {
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
        return true;
    }
    const size_t eq = line.find('=');
    const std::string key = trim(line.substr(0, eq));
    const std::string value = eq == std::string::npos ? std::string() : line.substr(eq + 1);

    Field* field = Field::get(key);
    if (field == nullptr) {
        std::cerr << fmt::format("Ignored unknown config: {}\n", key);
        return true;
    }
    if (!assigned->insert(field).second) {
        std::cerr << fmt::format("Config '{}' is assigned more than once, the last one wins\n", key);
    }
    if (!field->set_value(value)) {
        std::cerr << fmt::format("Invalid value of config '{}': '{}'\n", key, value);
        return false;
    }
    return true;
}

bool init(const char* filename) {
    std::ifstream input;
    if (filename != nullptr) {
        input.open(filename);
        if (input.fail()) {
            std::cerr << "Fail to open " << filename << std::endl;
            return false;
        }
    }
    return init(input);
}

bool init(std::istream& input) {
    for (const auto& [name, field] : Field::fields()) {
        if (!field->set_value(field->defval())) {
            std::cerr << fmt::format("Invalid default value of config '{}': '{}'\n", name, field->defval());
            return false;
        }
    }
    std::set<Field*> assigned;
    std::string line;
    while (std::getline(input, line)) {
        if (!apply_line(line, &assigned)) {
            return false;
        }
    }
    return true;
}

Status set_config(const std::string& field, const std::string& value) {
    Field* f = Field::get(field);
    if (f == nullptr) {
        return Status::NotFound(fmt::format("'{}' is not found", field));
    }
    if (!f->valmutable()) {
        return Status::NotSupported(fmt::format("'{}' is immutable", field));
    }
    if (!f->set_value(value)) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}': '{}'", field, value));
    }
    return Status::OK();
}

Status rollback_config(const std::string& field) {
    Field* f = Field::get(field);
    if (f == nullptr) {
        return Status::NotFound(fmt::format("'{}' is not found in rollback", field));
    }
    if (!f->rollback()) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}' in rollback", field));
    }
    return Status::OK();
}

std::vector<ConfigInfo> list_configs() {
    std::vector<ConfigInfo> infos;
    infos.reserve(Field::fields().size());
    for (const auto& [name, field] : Field::fields()) {
        infos.push_back({name, field->value(), field->type(), field->defval(), field->valmutable()});
    }
    return infos;
}

} // namespace strata::config
