// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the jm matching library
//
// This example demonstrates how to compare an expected JSON document
// against an actual one:
// - Strict equality
// - Partial matching by value and by type
// - Overriding the match mode for selected paths
// - Order independent array matching with wildcards
// - Reading diagnostics and handling bad paths

#include "../match.h"
#include <cstdlib>
#include <iostream>
#include <string>

using jm::Json;

static Json parse_or_die(const std::string& text)
{
    auto result = Json::parse(text);
    if (result.first != Json::success) {
        std::cerr << "Parse error: " << Json::StatusToString(result.first) << std::endl;
        exit(1);
    }
    return result.second;
}

static void report(const std::string& label, const jm::ComparisonResult& result)
{
    std::cout << label << ": " << (result.passed ? "match" : "mismatch") << std::endl;
    for (const auto& d : result.diagnostics) {
        std::cout << d.message << std::endl;
    }
}

// Example 1: Strict equality
void example_equality()
{
    std::cout << "\n=== Example 1: Strict Equality ===" << std::endl;

    Json expected = parse_or_die(R"({"id": 7, "tags": ["a", "b"]})");
    Json actual = parse_or_die(R"({"id": 7, "tags": ["a", "b", "c"]})");

    report("equals", jm::equals(expected, actual));
}

// Example 2: Partial matching
void example_partial()
{
    std::cout << "\n=== Example 2: Partial Matching ===" << std::endl;

    Json expected = parse_or_die(R"({"user": {"name": "Alice", "id": 1}})");
    Json actual = parse_or_die(R"({
        "user": {"name": "Bob", "id": 2, "role": "admin"},
        "requestId": "abc-123"
    })");

    jm::MatchOptions exact;
    report("exact", jm::matches(expected, actual, exact));

    jm::MatchOptions typed;
    typed.defaultMode = jm::MatchMode::TypeOnly;
    report("type", jm::matches(expected, actual, typed));
}

// Example 3: Alternate paths
void example_alternate_paths()
{
    std::cout << "\n=== Example 3: Alternate Paths ===" << std::endl;

    Json expected = parse_or_die(R"({"event": {"type": "click", "timestamp": 0, "meta.id": "x"}})");
    Json actual = parse_or_die(R"({"event": {"type": "click", "timestamp": 1718000000, "meta.id": "y"}})");

    try {
        // Only the type of the timestamp and the dotted key matter.
        jm::assertExactMatch(expected, actual, {"event.timestamp", "event.meta\\.id"});
        std::cout << "assertExactMatch passed" << std::endl;
    } catch (const jm::AssertionError& e) {
        std::cout << "assertExactMatch failed:\n" << e.what() << std::endl;
    }
}

// Example 4: Wildcards
void example_wildcards()
{
    std::cout << "\n=== Example 4: Wildcard Array Matching ===" << std::endl;

    Json expected = parse_or_die(R"([{"sku": "A"}, {"sku": "B"}])");
    Json actual = parse_or_die(R"([{"sku": "C"}, {"sku": "B"}, {"sku": "A"}])");

    jm::MatchOptions positional;
    report("positional", jm::matches(expected, actual, positional));

    jm::MatchOptions anywhere;
    anywhere.defaultMode = jm::MatchMode::TypeOnly;
    anywhere.alternatePaths = {"[*]"};
    report("[*] exact, any position", jm::matches(expected, actual, anywhere));
}

// Example 5: Bad paths
void example_bad_path()
{
    std::cout << "\n=== Example 5: Bad Paths ===" << std::endl;

    try {
        jm::assertTypeMatch(Json(1), Json(1), {"items[one]"});
    } catch (const jm::KeyPathError& e) {
        std::cout << "KeyPathError (expected): " << e.what() << std::endl;
    }
}

int main()
{
    std::cout << "JSON Match Example Program" << std::endl;
    std::cout << "==========================" << std::endl;

    example_equality();
    example_partial();
    example_alternate_paths();
    example_wildcards();
    example_bad_path();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
