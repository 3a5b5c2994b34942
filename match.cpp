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
#include "macros.h"

#include <memory>

namespace jm {

namespace {

const Json kAbsent;

MatchMode
invert(MatchMode mode)
{
    return mode == MatchMode::ExactValue ? MatchMode::TypeOnly
                                         : MatchMode::ExactValue;
}

const Json&
member(const Json& object, const std::string& key)
{
    const Json* value = object.find(key);
    return value ? *value : kAbsent;
}

bool
sameScalar(const Json& expected, const Json& actual)
{
    switch (expected.getType()) {
        case Json::Null:
            return true;
        case Json::Bool:
            return expected.getBool() == actual.getBool();
        case Json::Long:
            return expected.getLong() == actual.getLong();
        case Json::Double:
            return expected.getDouble() == actual.getDouble();
        case Json::String:
            return expected.getString() == actual.getString();
        default:
            ON_LOGIC_ERROR("Not a scalar JSON type.");
    }
}

// Walks expected and actual side by side. Failures are recorded only in
// strict mode; non-strict calls just answer yes or no.
class Comparator
{
  public:
    explicit Comparator(ComparisonResult& result) : result_(result)
    {
    }

    bool compare(const Json& expected,
                 const Json& actual,
                 const PathTree* tree,
                 MatchMode mode,
                 bool strict);

    bool equal(const Json& expected, const Json& actual);

  private:
    ComparisonResult& result_;
    KeyPath keyPath_;

    bool compareObjects(const Json& expected,
                        const Json& actual,
                        const PathTree* tree,
                        MatchMode mode,
                        bool strict);
    bool compareArrays(const Json& expected,
                       const Json& actual,
                       const PathTree* tree,
                       MatchMode mode,
                       bool strict);
    void fail(const std::string& message,
              const Json& expected,
              const Json& actual);
};

void
Comparator::fail(const std::string& message,
                 const Json& expected,
                 const Json& actual)
{
    Diagnostic d;
    d.keyPath = keyPath_;
    d.message = message;
    d.message += "\nExpected: ";
    d.message += expected.toString();
    d.message += "\nActual: ";
    d.message += actual.toString();
    d.message += "\nKey path: ";
    d.message += formatKeyPath(keyPath_);
    result_.diagnostics.push_back(std::move(d));
}

bool
Comparator::compare(const Json& expected,
                    const Json& actual,
                    const PathTree* tree,
                    MatchMode mode,
                    bool strict)
{
    if (expected.isNull())
        return true;
    if (actual.isNull()) {
        if (strict)
            fail("Expected JSON is non-null but Actual JSON is null.",
                 expected,
                 actual);
        return false;
    }
    if (expected.getType() != actual.getType()) {
        if (strict)
            fail("Expected and Actual types do not match.", expected, actual);
        return false;
    }
    switch (expected.getType()) {
        case Json::Bool:
        case Json::Long:
        case Json::Double:
        case Json::String:
            if (mode == MatchMode::TypeOnly || sameScalar(expected, actual))
                return true;
            if (strict)
                fail("Expected and Actual values do not match.", expected, actual);
            return false;
        case Json::Array:
            return compareArrays(expected, actual, tree, mode, strict);
        case Json::Object:
            return compareObjects(expected, actual, tree, mode, strict);
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

bool
Comparator::compareObjects(const Json& expected,
                           const Json& actual,
                           const PathTree* tree,
                           MatchMode mode,
                           bool strict)
{
    if (expected.size() > actual.size()) {
        if (strict)
            fail("Expected JSON has more elements than Actual JSON.\n"
                 "Expected count: " +
                   std::to_string(expected.size()) +
                   "\nActual count: " + std::to_string(actual.size()),
                 expected,
                 actual);
        return false;
    }
    bool ok = true;
    for (const auto& kv : expected.getObject()) {
        const PathTree* sub = tree ? tree->key(kv.first) : nullptr;
        keyPath_.emplace_back(kv.first);
        if (sub && sub->isTerminal())
            ok = compare(kv.second, member(actual, kv.first), nullptr,
                         invert(mode), strict) && ok;
        else
            ok = compare(kv.second, member(actual, kv.first), sub, mode,
                         strict) && ok;
        keyPath_.pop_back();
        if (!ok && !strict)
            return false;
    }
    return ok;
}

bool
Comparator::compareArrays(const Json& expected,
                          const Json& actual,
                          const PathTree* tree,
                          MatchMode mode,
                          bool strict)
{
    const std::vector<Json>& want = expected.getArray();
    const std::vector<Json>& have = actual.getArray();
    if (want.size() > have.size()) {
        if (strict)
            fail("Expected JSON has more elements than Actual JSON. "
                 "Impossible for Actual to fulfill Expected requirements.\n"
                 "Expected count: " +
                   std::to_string(want.size()) +
                   "\nActual count: " + std::to_string(have.size()),
                 expected,
                 actual);
        return false;
    }

    // "[*]" turns every index into a wildcard.
    const PathTree* general = tree ? tree->generalWildcard() : nullptr;
    std::vector<size_t> ordinal;
    std::vector<size_t> wildcards;
    for (size_t i = 0; i < want.size(); ++i) {
        if (general || (tree && tree->wildcard(i)))
            wildcards.push_back(i);
        else
            ordinal.push_back(i);
    }

    bool ok = true;
    std::vector<bool> claimed(have.size(), false);
    for (size_t i : ordinal) {
        const PathTree* sub = tree ? tree->index(i) : nullptr;
        keyPath_.emplace_back(i);
        if (sub && sub->isTerminal())
            ok = compare(want[i], have[i], nullptr, invert(mode), strict) && ok;
        else
            ok = compare(want[i], have[i], sub, mode, strict) && ok;
        keyPath_.pop_back();
        claimed[i] = true;
        if (!ok && !strict)
            return false;
    }

    for (size_t i : wildcards) {
        const PathTree* sub = general ? general : tree->wildcard(i);
        MatchMode m = sub->isTerminal() ? invert(mode) : mode;
        const PathTree* child = sub->isTerminal() ? nullptr : sub;
        bool found = false;
        keyPath_.emplace_back(i);
        for (size_t j = 0; j < have.size(); ++j) {
            if (claimed[j])
                continue;
            if (compare(want[i], have[j], child, m, false)) {
                claimed[j] = true;
                found = true;
                break;
            }
        }
        keyPath_.pop_back();
        if (!found) {
            if (strict) {
                Json remaining;
                remaining.setArray();
                for (size_t j = 0; j < have.size(); ++j)
                    if (!claimed[j])
                        remaining.getArray().push_back(have[j]);
                Diagnostic d;
                d.keyPath = keyPath_;
                d.message = "Wildcard ";
                d.message += m == MatchMode::ExactValue ? "exact" : "type";
                d.message += " match found no matches on Actual side "
                             "satisfying the Expected requirement.\n"
                             "Requirement: ";
                d.message += sub->toString();
                d.message += "\nExpected: ";
                d.message += want[i].toString();
                d.message += "\nActual (remaining unmatched elements): ";
                d.message += remaining.toString();
                d.message += "\nKey path: ";
                d.message += formatKeyPath(keyPath_);
                result_.diagnostics.push_back(std::move(d));
            }
            // Later wildcards can't be judged once the pool is off.
            return false;
        }
    }
    return ok;
}

bool
Comparator::equal(const Json& expected, const Json& actual)
{
    if (expected.isNull() || actual.isNull()) {
        if (expected.isNull() && actual.isNull())
            return true;
        if (expected.isNull())
            fail("Expected is null and Actual is non-null.", expected, actual);
        else
            fail("Actual is null and Expected is non-null.", expected, actual);
        return false;
    }
    if (expected.getType() != actual.getType()) {
        fail("Expected and Actual types do not match.", expected, actual);
        return false;
    }
    switch (expected.getType()) {
        case Json::Bool:
        case Json::Long:
        case Json::Double:
        case Json::String:
            if (sameScalar(expected, actual))
                return true;
            fail("Expected and Actual values do not match.", expected, actual);
            return false;
        case Json::Array:
        case Json::Object:
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
    if (expected.size() != actual.size()) {
        fail("Expected and Actual counts do not match (exact equality).\n"
             "Expected count: " +
               std::to_string(expected.size()) +
               "\nActual count: " + std::to_string(actual.size()),
             expected,
             actual);
        return false;
    }
    bool ok = true;
    if (expected.isArray()) {
        for (size_t i = 0; i < expected.size(); ++i) {
            keyPath_.emplace_back(i);
            ok = equal(expected.getArray()[i], actual.getArray()[i]) && ok;
            keyPath_.pop_back();
        }
    } else {
        for (const auto& kv : expected.getObject()) {
            keyPath_.emplace_back(kv.first);
            if (actual.contains(kv.first)) {
                ok = equal(kv.second, member(actual, kv.first)) && ok;
            } else {
                fail("Actual is missing key \"" + kv.first +
                       "\" (exact equality).",
                     expected,
                     actual);
                ok = false;
            }
            keyPath_.pop_back();
        }
    }
    return ok;
}

} // namespace

std::string
ComparisonResult::toString() const
{
    std::string b;
    for (const auto& d : diagnostics) {
        if (!b.empty())
            b += "\n\n";
        b += d.message;
    }
    return b;
}

AssertionError::AssertionError(const ComparisonResult& result)
  : std::runtime_error(result.toString()), result_(result)
{
}

ComparisonResult
matches(const Json& expected, const Json& actual, const MatchOptions& options)
{
    std::unique_ptr<PathTree> tree = PathTree::build(options.alternatePaths);
    ComparisonResult result;
    Comparator comparator(result);
    result.passed =
      comparator.compare(expected, actual, tree.get(), options.defaultMode, true);
    return result;
}

ComparisonResult
equals(const Json& expected, const Json& actual)
{
    ComparisonResult result;
    Comparator comparator(result);
    result.passed = comparator.equal(expected, actual);
    return result;
}

void
assertEqual(const Json& expected, const Json& actual)
{
    ComparisonResult result = equals(expected, actual);
    if (!result.passed)
        throw AssertionError(result);
}

void
assertExactMatch(const Json& expected,
                 const Json& actual,
                 const std::vector<std::string>& typeMatchPaths)
{
    MatchOptions options;
    options.defaultMode = MatchMode::ExactValue;
    options.alternatePaths = typeMatchPaths;
    ComparisonResult result = matches(expected, actual, options);
    if (!result.passed)
        throw AssertionError(result);
}

void
assertTypeMatch(const Json& expected,
                const Json& actual,
                const std::vector<std::string>& exactMatchPaths)
{
    MatchOptions options;
    options.defaultMode = MatchMode::TypeOnly;
    options.alternatePaths = exactMatchPaths;
    ComparisonResult result = matches(expected, actual, options);
    if (!result.passed)
        throw AssertionError(result);
}

} // namespace jm
