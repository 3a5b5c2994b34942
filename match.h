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

#ifndef JSONMATCH_MATCH_H_
#define JSONMATCH_MATCH_H_

#include "json.h"
#include "keypath.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace jm {

enum class MatchMode
{
    ExactValue, // same type and same value
    TypeOnly,   // same type
};

struct Diagnostic
{
    KeyPath keyPath;
    std::string message;
};

struct ComparisonResult
{
    bool passed = true;
    std::vector<Diagnostic> diagnostics;

    std::string toString() const;
};

struct MatchOptions
{
    MatchMode defaultMode = MatchMode::ExactValue;

    // Paths that use the opposite of defaultMode.
    std::vector<std::string> alternatePaths;
};

class AssertionError : public std::runtime_error
{
  public:
    explicit AssertionError(const ComparisonResult& result);

    const ComparisonResult& result() const
    {
        return result_;
    }

  private:
    ComparisonResult result_;
};

// Checks that actual satisfies every requirement of expected. Extra
// members and elements in actual are allowed, and a null in expected
// matches anything. Throws KeyPathError if an alternate path is
// malformed.
ComparisonResult matches(const Json& expected,
                         const Json& actual,
                         const MatchOptions& options);

// Strict deep equality. No paths, no wildcards, and null only equals
// null.
ComparisonResult equals(const Json& expected, const Json& actual);

// These throw AssertionError when the comparison fails.
void assertEqual(const Json& expected, const Json& actual);
void assertExactMatch(const Json& expected,
                      const Json& actual,
                      const std::vector<std::string>& typeMatchPaths = {});
void assertTypeMatch(const Json& expected,
                     const Json& actual,
                     const std::vector<std::string>& exactMatchPaths = {});

} // namespace jm

#endif // JSONMATCH_MATCH_H_
