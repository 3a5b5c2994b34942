// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
// Copyright 2024 The jsonmatch Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef JSONMATCH_JSON_H_
#define JSONMATCH_JSON_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jm {

// JSON value used as the input of every comparison.
//
// The value is a tagged union. Containers own their children, so a Json
// can be copied or moved like any other value type. Objects keep their
// members in insertion order and never hold two members with the same
// key.
class Json
{
  public:
    typedef std::vector<std::pair<std::string, Json>> Members;

    enum Type
    {
        Null,
        Bool,
        Long,
        Double,
        String,
        Array,
        Object
    };

    enum Status
    {
        success,
        bad_double,
        absent_value,
        bad_negative,
        bad_exponent,
        missing_comma,
        missing_colon,
        duplicate_key,
        malformed_utf8,
        depth_exceeded,
        unexpected_eof,
        overlong_ascii,
        unexpected_comma,
        unexpected_colon,
        unexpected_octal,
        trailing_content,
        illegal_character,
        invalid_hex_escape,
        overlong_utf8_0x7ff,
        overlong_utf8_0xffff,
        object_missing_value,
        illegal_utf8_character,
        invalid_unicode_escape,
        utf16_surrogate_in_utf8,
        unexpected_end_of_array,
        hex_escape_not_printable,
        invalid_escape_character,
        utf8_exceeds_utf16_range,
        unexpected_end_of_string,
        unexpected_end_of_object,
        object_key_must_be_string,
        c1_control_code_in_string,
        non_del_c0_control_code_in_string,
    };

    Json() : type_(Null)
    {
    }

    Json(std::nullptr_t) : type_(Null)
    {
    }

    Json(bool value) : type_(Bool), bool_value(value)
    {
    }

    Json(int value) : type_(Long), long_value(value)
    {
    }

    Json(long value) : type_(Long), long_value(value)
    {
    }

    Json(long long value) : type_(Long), long_value(value)
    {
    }

    Json(unsigned value) : type_(Long), long_value(value)
    {
    }

    Json(unsigned long value);
    Json(unsigned long long value);

    Json(float value) : type_(Double), double_value(value)
    {
    }

    Json(double value) : type_(Double), double_value(value)
    {
    }

    Json(const char* value);
    Json(const std::string& value);
    Json(std::string&& value);

    ~Json();

    Json(const Json& other);
    Json& operator=(const Json& other);
    Json(Json&& other);
    Json& operator=(Json&& other);

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isNumber() const
    {
        return type_ == Long || type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    long long getLong() const;
    double getDouble() const;
    double getNumber() const;
    std::string& getString();
    const std::string& getString() const;
    std::vector<Json>& getArray();
    const std::vector<Json>& getArray() const;
    Members& getObject();
    const Members& getObject() const;

    // Number of elements or members. Scalars and null have no size.
    size_t size() const;

    bool contains(const std::string& key) const;

    // Member named key, or nullptr if this isn't an object or has no such
    // member.
    const Json* find(const std::string& key) const;

    void setArray();
    void setObject();

    Json& operator[](size_t index);
    Json& operator[](const std::string& key);

    std::string toString() const;
    std::string toStringPretty() const;

    static const char* StatusToString(Status status);
    static std::pair<Status, Json> parse(const std::string& text);

  private:
    Type type_;
    union
    {
        bool bool_value;
        long long long_value;
        double double_value;
        std::string string_value;
        std::vector<Json> array_value;
        Members object_value;
    };

    void clear();
    void copyFrom(const Json& other);
    void moveFrom(Json&& other);
    void marshal(std::string& b, bool pretty, int indent) const;
    static void stringify(std::string& b, const std::string& s);
    static void serialize(std::string& b, const std::string& s);
    static Status parse(Json& json,
                        const char*& p,
                        const char* e,
                        int context,
                        int depth);
};

} // namespace jm

#endif // JSONMATCH_JSON_H_
