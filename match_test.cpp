// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
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

#include "match.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

using jm::AssertionError;
using jm::ComparisonResult;
using jm::Json;
using jm::KeyPathError;
using jm::MatchMode;
using jm::MatchOptions;

typedef std::vector<std::string> Paths;

static Json
J(const std::string& text)
{
    std::pair<Json::Status, Json> res = Json::parse(text);
    if (res.first != Json::success) {
        printf("error: bad test json %s: %s\n",
               Json::StatusToString(res.first),
               text.c_str());
        exit(99);
    }
    return res.second;
}

template<typename F>
static bool
Fails(F&& f)
{
    try {
        f();
    } catch (const AssertionError&) {
        return true;
    }
    return false;
}

static bool
ExactFails(const Json& e, const Json& a, const Paths& paths = {})
{
    return Fails([&] { jm::assertExactMatch(e, a, paths); });
}

static bool
TypeFails(const Json& e, const Json& a, const Paths& paths = {})
{
    return Fails([&] { jm::assertTypeMatch(e, a, paths); });
}

static bool
EqualFails(const Json& e, const Json& a)
{
    return Fails([&] { jm::assertEqual(e, a); });
}

static ComparisonResult
Match(const Json& e, const Json& a, MatchMode mode, const Paths& paths = {})
{
    MatchOptions options;
    options.defaultMode = mode;
    options.alternatePaths = paths;
    return jm::matches(e, a, options);
}

static const char* const kValues[] = {
    "5",   "5.0",       "true",           "\"a\"",       "{\"key1\":1}",
    "[1]", "null",      "{}",             "[]",          "\"\"",
    "[[1,[2,{\"x\":null}]],{\"y\":false}]",
};

void
value_matching_test()
{
    for (size_t i = 0; i < ARRAYLEN(kValues); ++i) {
        Json v = J(kValues[i]);
        if (EqualFails(v, v) || ExactFails(v, v) || TypeFails(v, v)) {
            printf("error: %s should match itself\n", kValues[i]);
            exit(1);
        }
    }
}

static const struct
{
    const char* expected;
    const char* actual;
} kSameTypes[] = {
    { "5", "10" },
    { "5.0", "10.0" },
    { "true", "false" },
    { "\"a\"", "\"b\"" },
    { "{\"key1\":1}", "{\"key1\":2}" },
    { "{\"key1\":{\"key2\":\"a\"}}", "{\"key1\":{\"key2\":\"b\",\"key3\":3}}" },
    { "[1,\"a\",true]", "[2,\"b\",false]" },
};

void
type_matching_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSameTypes); ++i) {
        Json e = J(kSameTypes[i].expected);
        Json a = J(kSameTypes[i].actual);
        if (!EqualFails(e, a) || !ExactFails(e, a) || TypeFails(e, a)) {
            printf("error: %s vs %s should only match by type\n",
                   kSameTypes[i].expected,
                   kSameTypes[i].actual);
            exit(2);
        }
    }
}

static const struct
{
    const char* expected;
    const char* actual;
} kSubsets[] = {
    { "[1]", "[1,2]" },
    { "{\"a\":1}", "{\"a\":1,\"b\":2}" },
    { "[{\"a\":1}]", "[{\"a\":1,\"b\":2}]" },
    { "{\"a\":[1]}", "{\"a\":[1,2],\"b\":{}}" },
    { "{}", "{\"a\":1}" },
    { "[]", "[1]" },
};

void
flexible_collection_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSubsets); ++i) {
        Json e = J(kSubsets[i].expected);
        Json a = J(kSubsets[i].actual);
        if (!EqualFails(e, a) || ExactFails(e, a) || TypeFails(e, a)) {
            printf("error: %s should be a flexible subset of %s\n",
                   kSubsets[i].expected,
                   kSubsets[i].actual);
            exit(3);
        }
    }
}

static const char* const kKinds[] = {
    "1", "1.0", "\"1\"", "true", "{\"a\":1}", "[1]",
};

void
failure_test()
{
    for (size_t i = 0; i < ARRAYLEN(kKinds); ++i) {
        for (size_t j = 0; j < ARRAYLEN(kKinds); ++j) {
            if (i == j)
                continue;
            Json e = J(kKinds[i]);
            Json a = J(kKinds[j]);
            if (!EqualFails(e, a) || !ExactFails(e, a) || !TypeFails(e, a)) {
                printf("error: %s vs %s should never match\n",
                       kKinds[i],
                       kKinds[j]);
                exit(4);
            }
            ComparisonResult r = Match(e, a, MatchMode::TypeOnly);
            if (r.diagnostics.size() != 1 ||
                r.diagnostics[0].message.find(
                  "Expected and Actual types do not match.") != 0)
                exit(5);
        }
        Json e = J(kKinds[i]);
        if (!EqualFails(e, Json()) || !ExactFails(e, Json()) ||
            !TypeFails(e, Json()))
            exit(6);
    }
    Json e = J(R"({"a":1})");
    Json a = J(R"({"b":1})");
    if (!EqualFails(e, a) || !ExactFails(e, a) || !TypeFails(e, a))
        exit(7);
    ComparisonResult r = Match(e, a, MatchMode::TypeOnly);
    if (r.diagnostics.size() != 1 ||
        r.diagnostics[0].message !=
          "Expected JSON is non-null but Actual JSON is null.\n"
          "Expected: 1\n"
          "Actual: null\n"
          "Key path: a")
        exit(8);
}

void
null_wildcard_test()
{
    Json five(5);
    if (ExactFails(Json(), five) || TypeFails(Json(), five))
        exit(10);
    if (!EqualFails(Json(), five) || !EqualFails(five, Json()))
        exit(11);
    if (EqualFails(Json(), J("null")))
        exit(12);
    if (TypeFails(J(R"({"a":null})"), J(R"({"a":5})")))
        exit(13);
    if (ExactFails(J(R"({"a":null})"), J(R"({"b":"x"})")))
        exit(14);
    if (ExactFails(J("[null,2]"), J("[\"q\",2]")))
        exit(15);
    if (!EqualFails(J(R"({"a":null})"), J(R"({"a":5})")))
        exit(16);
}

static const struct
{
    const char* key;
    const char* path;
} kSpecialKeys[] = {
    { "", "" },
    { "key.with.dot", "key\\.with\\.dot" },
    { "k.1.2.3", "k\\.1\\.2\\.3" },
    { "[0]", "\\[0\\]" },
    { "[1]", "\\[1\\]" },
    { "a[1]b", "a[1]b" },
    { "\\", "\\" },
    { "\\.", "\\\\." },
    { " ", " " },
    { "\"", "\"" },
    { "@#$%^&*()", "@#$%^&*()" },
};

void
special_key_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSpecialKeys); ++i) {
        Json e;
        Json a;
        e[kSpecialKeys[i].key] = 1;
        a[kSpecialKeys[i].key] = 2;
        Paths paths = { kSpecialKeys[i].path };
        if (EqualFails(e, e) || ExactFails(e, e) || TypeFails(e, e))
            exit(20);
        if (ExactFails(e, a, paths) || !TypeFails(e, a, paths)) {
            printf("error: path %s should address key %s\n",
                   kSpecialKeys[i].path,
                   kSpecialKeys[i].key);
            exit(21);
        }
    }

    // Nested empty keys.
    Json e = J(R"({"":{"":1}})");
    Json a = J(R"({"":{"":2}})");
    if (ExactFails(e, a, { "." }) || ExactFails(e, a, { "" }) ||
        !ExactFails(e, a, { ".x" }))
        exit(22);
}

void
alternate_path_value_test()
{
    Json e = J(R"({"key1":1})");
    Json a = J(R"({"key1":2})");
    if (ExactFails(e, a, { "key1" }) || !TypeFails(e, a, { "key1" }))
        exit(30);
    if (!ExactFails(e, a, { "key2" }))
        exit(31);

    e = J("[1]");
    a = J("[2]");
    if (ExactFails(e, a, { "[0]" }) || !TypeFails(e, a, { "[0]" }))
        exit(32);
    if (ExactFails(e, a, { "[*]" }) || !TypeFails(e, a, { "[*]" }))
        exit(33);
    if (!ExactFails(e, a, { "[1]" }))
        exit(34);
}

void
alternate_path_type_test()
{
    Json e = J(R"({"key1":1})");
    if (!ExactFails(e, J(R"({"key1":"a"})"), { "key1" }))
        exit(40);
    if (!TypeFails(e, J(R"({"key1":"a"})"), { "key1" }))
        exit(41);

    e = J("[1]");
    if (!ExactFails(e, J("[\"a\"]"), { "[0]" }))
        exit(42);
    if (!ExactFails(e, J("[\"a\"]"), { "[*]" }))
        exit(43);
    if (!TypeFails(e, J("[\"a\"]"), { "[*]" }))
        exit(44);
}

static const Paths kLargerArrayPaths[] = {
    {},
    { "[0]" },
    { "[1]" },
    { "[0]", "[1]" },
    { "[*0]" },
    { "[*1]" },
    { "[*]" },
};

void
expected_larger_test()
{
    Json e = J("[1,2]");
    Json a = J("[1]");
    for (size_t i = 0; i < ARRAYLEN(kLargerArrayPaths); ++i) {
        if (!ExactFails(e, a, kLargerArrayPaths[i]) ||
            !TypeFails(e, a, kLargerArrayPaths[i]))
            exit(50);
    }
    ComparisonResult r = Match(e, a, MatchMode::ExactValue, { "[*]" });
    if (r.passed || r.diagnostics.size() != 1 ||
        r.diagnostics[0].message !=
          "Expected JSON has more elements than Actual JSON. Impossible for "
          "Actual to fulfill Expected requirements.\n"
          "Expected count: 2\n"
          "Actual count: 1\n"
          "Expected: [1,2]\n"
          "Actual: [1]\n"
          "Key path: ")
        exit(51);

    e = J(R"({"a":1,"b":2})");
    a = J(R"({"a":1})");
    static const Paths kLargerObjectPaths[] = {
        {}, { "a" }, { "b" }, { "a", "b" },
    };
    for (size_t i = 0; i < ARRAYLEN(kLargerObjectPaths); ++i) {
        if (!ExactFails(e, a, kLargerObjectPaths[i]) ||
            !TypeFails(e, a, kLargerObjectPaths[i]))
            exit(52);
    }
    r = Match(J(R"({"x":{"a":1,"b":2}})"), J(R"({"x":{"a":1}})"),
              MatchMode::TypeOnly);
    if (r.diagnostics.size() != 1 ||
        r.diagnostics[0].message.find(
          "Expected JSON has more elements than Actual JSON.\n"
          "Expected count: 2\n"
          "Actual count: 1\n") != 0 ||
        jm::formatKeyPath(r.diagnostics[0].keyPath) != "x")
        exit(53);
}

void
wildcard_order_test()
{
    Json e = J("[1,2]");
    Json a = J(R"(["a","b",1,2])");
    if (ExactFails(e, a, { "[*0]", "[*1]" }) ||
        ExactFails(e, a, { "[*1]", "[*0]" }))
        exit(60);

    a = J("[2,1]");
    if (TypeFails(e, a, { "[*0]", "[*1]" }) ||
        TypeFails(e, a, { "[*1]", "[*0]" }))
        exit(61);
    if (!ExactFails(e, a) || TypeFails(e, a))
        exit(62);
}

static const struct
{
    const char* expected;
    const char* actual;
} kWildcardPairs[] = {
    { "[1,2]", "[2,1]" },
    { "[1,2]", "[3,1,2]" },
    { "[1,2]", "[\"a\",1]" },
    { "[1,2]", "[1,1]" },
    { "[1,2]", "[4,3,2,1]" },
    { R"([{"a":1},{"a":2}])", R"([{"a":2,"b":0},{"a":1}])" },
    { R"([{"a":1},{"a":2}])", R"([{"a":"x"},{"a":1}])" },
};

void
general_wildcard_superset_test()
{
    for (size_t i = 0; i < ARRAYLEN(kWildcardPairs); ++i) {
        Json e = J(kWildcardPairs[i].expected);
        Json a = J(kWildcardPairs[i].actual);
        for (MatchMode mode : { MatchMode::ExactValue, MatchMode::TypeOnly }) {
            bool each = Match(e, a, mode, { "[*0]", "[*1]" }).passed;
            bool all = Match(e, a, mode, { "[*]" }).passed;
            if (each != all) {
                printf("error: [*] disagrees with [*0],[*1] on %s vs %s\n",
                       kWildcardPairs[i].expected,
                       kWildcardPairs[i].actual);
                exit(70);
            }
        }
    }
}

void
wildcard_placement_test()
{
    Json e = J("[1,2]");
    Json a = J("[3,2]");
    if (ExactFails(e, a, { "[*0]" }) || ExactFails(e, a, { "[0*]" }))
        exit(80);
    a = J("[\"x\",2]");
    if (!ExactFails(e, a, { "[*0]" }) || !ExactFails(e, a, { "[0*]" }))
        exit(81);
    // A wildcard beyond the expected array is ignored.
    if (ExactFails(J("[1]"), J("[1,5]"), { "[*3]" }))
        exit(82);
}

void
specific_index_vs_wildcard_test()
{
    Json e = J("[1]");
    Json a = J(R"(["a",1])");
    if (!ExactFails(e, a, { "[0]" }))
        exit(90);
    if (ExactFails(e, a, { "[*]" }))
        exit(91);
    if (TypeFails(e, a, { "[*]" }) || !TypeFails(e, a))
        exit(92);
}

void
standard_index_priority_test()
{
    if (ExactFails(J("[1,1]"), J(R"(["a",1,1])"), { "[*0]" }))
        exit(100);
    // Once an ordinal index spends an element, wildcards can't use it.
    if (!TypeFails(J("[1,2]"), J("[2,1]"), { "[*0]" }))
        exit(101);
}

void
exact_and_wildcard_modes_test()
{
    Json e = J("[1,2]");
    Json a = J("[4,3,2,1]");
    if (ExactFails(e, a, { "[0]", "[1]" }) || ExactFails(e, a, { "[*]" }))
        exit(110);
    if (!TypeFails(e, a, { "[0]", "[1]" }) || TypeFails(e, a, { "[*]" }))
        exit(111);
}

void
specific_index_wildcard_test()
{
    Json e = J("[1,2]");
    if (ExactFails(e, J("[1,3,2,1]"), { "[*1]" }) ||
        TypeFails(e, J("[1,3,2,1]"), { "[*1]" }))
        exit(120);
    ComparisonResult r =
      Match(e, J("[1,3,4,1]"), MatchMode::TypeOnly, { "[*1]" });
    if (r.passed || r.diagnostics.size() != 1)
        exit(121);
    if (r.diagnostics[0].message !=
        "Wildcard exact match found no matches on Actual side satisfying the "
        "Expected requirement.\n"
        "Requirement: [*1]\n"
        "Expected: 2\n"
        "Actual (remaining unmatched elements): [3,4,1]\n"
        "Key path: ") {
        printf("error: %s\n", r.diagnostics[0].message.c_str());
        exit(122);
    }
}

void
wildcard_halt_test()
{
    ComparisonResult r =
      Match(J("[1,2,3]"), J("[9,8,3]"), MatchMode::TypeOnly, { "[*0]", "[*1]" });
    if (r.passed || r.diagnostics.size() != 1)
        exit(130);
    if (r.diagnostics[0].message.find("Expected: 1\n") == std::string::npos)
        exit(131);

    // Trying candidates leaves no trace.
    r = Match(J(R"([{"a":1}])"),
              J(R"([{"a":2},{"a":1}])"),
              MatchMode::TypeOnly,
              { "[*]" });
    if (!r.passed || !r.diagnostics.empty())
        exit(132);
}

void
chaining_test()
{
    if (ExactFails(J(R"([{"key1":1}])"), J(R"([{"key1":2}])"), { "[0].key1" }) ||
        !ExactFails(J(R"([{"key1":1}])"), J(R"([{"key1":2}])")))
        exit(140);
    Json e = J(R"([{"key1":1}])");
    Json a = J(R"([{"key1":"x"},{"key1":2}])");
    if (ExactFails(e, a, { "[*].key1" }) || !ExactFails(e, a))
        exit(141);
    if (ExactFails(J("[[1]]"), J("[[2]]"), { "[0][0]" }))
        exit(142);
    if (ExactFails(J("[[[[1]]]]"), J("[[[[2]]]]"), { "[0][0][0][0]" }) ||
        !ExactFails(J("[[[[1]]]]"), J("[[[[2]]]]"), { "[0][0][0][1]" }))
        exit(143);
    if (ExactFails(J(R"({"key1":[1]})"), J(R"({"key1":[2]})"), { "key1[0]" }))
        exit(144);
    e = J(R"({"key1":[1,2]})");
    a = J(R"({"key1":["a",3,4]})");
    if (ExactFails(e, a, { "key1[*]" }) || !TypeFails(e, a, { "key1[*]" }))
        exit(145);
}

void
mode_inversion_test()
{
    Json e = J(R"({"a":1,"b":"x"})");
    Json a = J(R"({"a":1,"b":"y"})");
    if (!Match(e, a, MatchMode::ExactValue, { "b" }).passed)
        exit(150);
    if (!Match(e, a, MatchMode::TypeOnly, { "a" }).passed)
        exit(151);
    if (Match(e, a, MatchMode::TypeOnly, { "b" }).passed)
        exit(152);
    // Inverting every leaf is the same as switching modes.
    Json c = J(R"({"a":2,"b":"y"})");
    if (Match(e, c, MatchMode::ExactValue, { "a", "b" }).passed !=
        Match(e, c, MatchMode::TypeOnly).passed)
        exit(153);
    if (Match(e, c, MatchMode::TypeOnly, { "a", "b" }).passed !=
        Match(e, c, MatchMode::ExactValue).passed)
        exit(154);
}

void
scenario_test()
{
    Json e = J(R"({"key1":{"key2":"a"}})");
    Json a = J(R"({"key1":{"key2":"b","key3":3}})");
    if (TypeFails(e, a))
        exit(160);
    ComparisonResult r = Match(e, a, MatchMode::ExactValue);
    if (r.passed || r.diagnostics.size() != 1)
        exit(161);
    if (r.diagnostics[0].message != "Expected and Actual values do not match.\n"
                                    "Expected: \"a\"\n"
                                    "Actual: \"b\"\n"
                                    "Key path: key1.key2")
        exit(162);
    if (r.diagnostics[0].keyPath.size() != 2 ||
        r.diagnostics[0].keyPath[1].key != "key2")
        exit(163);
    if (ExactFails(e, a, { "key1.key2" }) || !TypeFails(e, a, { "key1.key2" }))
        exit(164);
    if (ExactFails(e, a, { "key1" }))
        exit(165);
}

void
collect_diagnostics_test()
{
    Json e = J(R"({"a":1,"b":2,"c":3})");
    Json a = J(R"({"a":0,"b":2,"c":0})");
    try {
        jm::assertExactMatch(e, a);
        exit(170);
    } catch (const AssertionError& err) {
        const ComparisonResult& r = err.result();
        if (r.passed || r.diagnostics.size() != 2)
            exit(171);
        if (jm::formatKeyPath(r.diagnostics[0].keyPath) != "a" ||
            jm::formatKeyPath(r.diagnostics[1].keyPath) != "c")
            exit(172);
        std::string what = err.what();
        if (what.find("Key path: a") == std::string::npos ||
            what.find("Key path: c") == std::string::npos)
            exit(173);
    }
}

void
member_order_test()
{
    // Members are reported in the order the document lists them.
    Json e = J(R"({"z":1,"a":2})");
    Json a = J(R"({"a":0,"z":0})");
    ComparisonResult r = Match(e, a, MatchMode::ExactValue);
    if (r.diagnostics.size() != 2)
        exit(175);
    if (jm::formatKeyPath(r.diagnostics[0].keyPath) != "z" ||
        jm::formatKeyPath(r.diagnostics[1].keyPath) != "a")
        exit(176);
    r = Match(J(R"({"m":{"z":1,"a":2}})"), J(R"({"m":[]})"), MatchMode::TypeOnly);
    if (r.diagnostics.size() != 1 ||
        r.diagnostics[0].message != "Expected and Actual types do not match.\n"
                                    "Expected: {\"z\":1,\"a\":2}\n"
                                    "Actual: []\n"
                                    "Key path: m")
        exit(177);
}

void
setup_error_test()
{
    bool threw = false;
    try {
        jm::assertExactMatch(J("[1]"), J("[1]"), { "[x]" });
    } catch (const KeyPathError&) {
        threw = true;
    }
    if (!threw)
        exit(180);
    threw = false;
    try {
        jm::assertTypeMatch(J("[1]"), J("[\"a\"]"), { "ok", "a[" });
    } catch (const KeyPathError&) {
        threw = true;
    }
    if (!threw)
        exit(181);
    threw = false;
    try {
        Match(J("[1,2]"), J("[1,2]"), MatchMode::ExactValue, { "[*0]", "[0*]" });
    } catch (const KeyPathError&) {
        threw = true;
    }
    if (!threw)
        exit(182);
}

void
equals_test()
{
    ComparisonResult r = jm::equals(J("[1,2]"), J("[1,2,3]"));
    if (r.passed || r.diagnostics.size() != 1 ||
        r.diagnostics[0].message.find(
          "Expected and Actual counts do not match (exact equality).\n"
          "Expected count: 2\n"
          "Actual count: 3\n") != 0)
        exit(190);
    r = jm::equals(J(R"({"a":1})"), J(R"({"b":1})"));
    if (r.passed ||
        r.diagnostics[0].message.find(
          "Actual is missing key \"a\" (exact equality).") != 0)
        exit(191);
    // A null under a missing key is still a missing key.
    r = jm::equals(J(R"({"a":null})"), J(R"({"b":1})"));
    if (r.passed || r.diagnostics.size() != 1 ||
        jm::formatKeyPath(r.diagnostics[0].keyPath) != "a")
        exit(195);
    if (!EqualFails(J(R"({"a":null})"), J(R"({"b":1})")))
        exit(196);
    if (!EqualFails(J(R"({"x":{"a":null,"c":2}})"), J(R"({"x":{"b":null,"c":2}})")))
        exit(197);
    if (EqualFails(J(R"({"a":null,"b":1})"), J(R"({"b":1,"a":null})")))
        exit(198);
    r = jm::equals(Json(), Json(1));
    if (r.passed ||
        r.diagnostics[0].message.find(
          "Expected is null and Actual is non-null.") != 0)
        exit(192);
    r = jm::equals(J(R"({"a":[1,{"b":null}]})"), J(R"({"a":[1,{"b":null}]})"));
    if (!r.passed || !r.diagnostics.empty())
        exit(193);
    if (!jm::equals(J("1"), J("1.0")).diagnostics.size())
        exit(194);
}

int
main()
{
    value_matching_test();
    type_matching_test();
    flexible_collection_test();
    failure_test();
    null_wildcard_test();
    special_key_test();
    alternate_path_value_test();
    alternate_path_type_test();
    expected_larger_test();
    wildcard_order_test();
    general_wildcard_superset_test();
    wildcard_placement_test();
    specific_index_vs_wildcard_test();
    standard_index_priority_test();
    exact_and_wildcard_modes_test();
    specific_index_wildcard_test();
    wildcard_halt_test();
    chaining_test();
    mode_inversion_test();
    scenario_test();
    collect_diagnostics_test();
    member_order_test();
    setup_error_test();
    equals_test();

    BENCH(2000, 1, value_matching_test());
    BENCH(2000, 1, general_wildcard_superset_test());
    BENCH(2000, 1, chaining_test());
}
