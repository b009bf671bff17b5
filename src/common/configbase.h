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

#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata {
class Status;

namespace config {

struct ConfigInfo {
    std::string name;
    std::string value;
    std::string type;
    std::string defval;
    bool valmutable;

    bool operator<(const ConfigInfo& rhs) const { return name < rhs.name; }

    bool operator==(const ConfigInfo& rhs) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ConfigInfo& info) {
    os << "ConfigInfo{"
       << "name=\"" << info.name << "\","
       << "value=\"" << info.value << "\","
       << "type=" << info.type << ","
       << "default=\"" << info.defval << "\","
       << "mutable=" << info.valmutable << "}";
    return os;
}

#ifdef __IN_CONFIGBASE_CPP__

bool strtox(const std::string& valstr, bool& retval);
bool strtox(const std::string& valstr, int32_t& retval);
bool strtox(const std::string& valstr, double& retval);
bool strtox(const std::string& valstr, std::string& retval);

template <typename T>
bool strtox(const std::string& valstr, std::vector<T>& retval);

// Registered config item. Every CONF_xxx() macro expanded inside configbase.cpp
// creates one static Field bound to the storage of the config variable.
class Field {
public:
    Field(const char* type, const char* name, const char* defval, bool valmutable)
            : _type(type), _name(name), _defval(defval), _valmutable(valmutable) {
        fields().emplace(_name, this);
    }

    virtual ~Field() = default;

    const std::string& type() const { return _type; }
    const std::string& name() const { return _name; }
    const std::string& defval() const { return _defval; }
    bool valmutable() const { return _valmutable; }
    const std::string& value() const { return _current_set_val; }

    // Parse and store. The previous value is kept for rollback().
    bool set_value(std::string value);

    bool rollback();

    static std::map<std::string, Field*>& fields() {
        static std::map<std::string, Field*> s_fields;
        return s_fields;
    }

    // nullptr for an unknown name
    static Field* get(const std::string& name);

protected:
    virtual bool parse_value(const std::string& valstr) = 0;

private:
    std::string _type;
    std::string _name;
    std::string _defval;
    bool _valmutable;
    std::string _current_set_val;
    std::string _last_set_val;
};

template <typename T>
class TypedField final : public Field {
public:
    TypedField(const char* type, const char* name, T* storage, const char* defval, bool valmutable)
            : Field(type, name, defval, valmutable), _storage(storage) {}

protected:
    bool parse_value(const std::string& valstr) override { return strtox(valstr, *_storage); }

private:
    T* _storage;
};

// A string config restricted to a fixed, comma separated set of values.
class EnumField final : public Field {
public:
    EnumField(const char* name, std::string* storage, const char* defval, const char* enums, bool valmutable);

protected:
    bool parse_value(const std::string& valstr) override;

private:
    std::string* _storage;
    std::set<std::string> _enums;
};

template <typename T>
bool strtox(const std::string& valstr, std::vector<T>& retval) {
    std::vector<T> parsed;
    size_t start = 0;
    while (start <= valstr.size()) {
        size_t end = valstr.find(',', start);
        if (end == std::string::npos) {
            end = valstr.size();
        }
        std::string item = valstr.substr(start, end - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        item = (b == std::string::npos) ? std::string() : item.substr(b, e - b + 1);
        if (!item.empty()) {
            T value{};
            if (!strtox(item, value)) {
                return false;
            }
            parsed.push_back(std::move(value));
        }
        start = end + 1;
    }
    retval.swap(parsed);
    return true;
}

#define DEFINE_FIELD(FIELD_TYPE, FIELD_NAME, FIELD_DEFAULT, VALMUTABLE) \
    FIELD_TYPE FIELD_NAME;                                              \
    static ::strata::config::TypedField<FIELD_TYPE> field_##FIELD_NAME(#FIELD_TYPE, #FIELD_NAME, &FIELD_NAME, \
                                                                       FIELD_DEFAULT, VALMUTABLE);

#define CONF_Int32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, false)
#define CONF_String(name, defaultstr) DEFINE_FIELD(std::string, name, defaultstr, false)
#define DEFINE_ENUM_FIELD(FIELD_NAME, FIELD_DEFAULT, FIELD_ENUMS, VALMUTABLE) \
    std::string FIELD_NAME;                                                  \
    static ::strata::config::EnumField field_##FIELD_NAME(#FIELD_NAME, &FIELD_NAME, FIELD_DEFAULT, FIELD_ENUMS, \
                                                          VALMUTABLE);
#define CONF_String_enum(name, defaultstr, enums) DEFINE_ENUM_FIELD(name, defaultstr, enums, false)
#define CONF_mString_enum(name, defaultstr, enums) DEFINE_ENUM_FIELD(name, defaultstr, enums, true)
#define CONF_Strings(name, defaultstr) DEFINE_FIELD(std::vector<std::string>, name, defaultstr, false)
#define CONF_mBool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, true)
#define CONF_mInt32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, true)
#define CONF_mDouble(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, true)
#define CONF_mStrings(name, defaultstr) DEFINE_FIELD(std::vector<std::string>, name, defaultstr, true)

#else

#define DECLARE_FIELD(FIELD_TYPE, FIELD_NAME) extern FIELD_TYPE FIELD_NAME;

#define CONF_Int32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_String(name, defaultstr) DECLARE_FIELD(std::string, name)
#define CONF_String_enum(name, defaultstr, enums) DECLARE_FIELD(std::string, name)
#define CONF_mString_enum(name, defaultstr, enums) DECLARE_FIELD(std::string, name)
#define CONF_Strings(name, defaultstr) DECLARE_FIELD(std::vector<std::string>, name)
#define CONF_mBool(name, defaultstr) DECLARE_FIELD(bool, name)
#define CONF_mInt32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_mDouble(name, defaultstr) DECLARE_FIELD(double, name)
#define CONF_mStrings(name, defaultstr) DECLARE_FIELD(std::vector<std::string>, name)

#endif // __IN_CONFIGBASE_CPP__

// Initialize configurations from a config file.
bool init(const char* filename);

// Initialize configurations from a input stream.
bool init(std::istream& input);

Status set_config(const std::string& field, const std::string& value);

Status rollback_config(const std::string& field);

std::vector<ConfigInfo> list_configs();

} // namespace config
} // namespace strata
