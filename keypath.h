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

#ifndef JSONMATCH_KEYPATH_H_
#define JSONMATCH_KEYPATH_H_

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace jm {

// Thrown when a path string can't be turned into a path tree. This is a
// mistake in how the assertion was written, never a data mismatch.
class KeyPathError : public std::runtime_error
{
  public:
    KeyPathError(const std::string& path, size_t pos, const std::string& what);

    const std::string& path() const
    {
        return path_;
    }

    size_t position() const
    {
        return pos_;
    }

  private:
    std::string path_;
    size_t pos_;
};

enum class WildcardKind
{
    None,
    Specific,
    General
};

struct PathSegment
{
    enum class Kind
    {
        Key,
        Index
    };

    Kind kind;
    std::string name;
    size_t index;
    WildcardKind wildcard;
    bool starFirst; // "[*N]" rather than "[N*]"
    size_t pos;     // offset of the segment in the path string

    static PathSegment makeKey(const std::string& name);
    static PathSegment makeIndex(size_t index, WildcardKind wildcard,
                                 bool starFirst = true);

    bool isKey() const
    {
        return kind == Kind::Key;
    }

    // Canonical spelling: name, "[N]", "[*N]", "[N*]" or "[*]".
    std::string token() const;
};

// Parses a path such as "key1[*0].key2" into its segments.
//
//   - "." separates keys unless written as "\."
//   - "[N]" is a fixed index, "[*N]" or "[N*]" a wildcard for index N
//     and "[*]" a wildcard for every index
//   - "\[" and "\]" are literal brackets inside a key
//
// Throws KeyPathError on malformed input.
std::vector<PathSegment> parseKeyPath(const std::string& path);

// Merged set of alternate paths. Every node is either a terminal, which
// flips the match mode for everything below it, or a branch that keeps
// descending with the current mode.
class PathTree
{
  public:
    // Returns nullptr when there are no paths.
    static std::unique_ptr<PathTree> build(const std::vector<std::string>& paths);

    bool isTerminal() const
    {
        return terminal_;
    }

    // Path string that created this terminal.
    const std::string& path() const
    {
        return path_;
    }

    const PathTree* key(const std::string& name) const;
    const PathTree* index(size_t i) const;
    const PathTree* wildcard(size_t i) const;
    const PathTree* generalWildcard() const;

    // Token spelling of the wildcard entry for index i, or empty.
    std::string wildcardToken(size_t i) const;

    bool hasWildcards() const
    {
        return general_ || !wildcards_.empty();
    }

    std::string toString() const;

  private:
    struct Wildcard
    {
        std::string token;
        std::unique_ptr<PathTree> tree;
    };

    bool terminal_ = false;
    std::string path_;
    std::map<std::string, std::unique_ptr<PathTree>> keys_;
    std::map<size_t, std::unique_ptr<PathTree>> indices_;
    std::map<size_t, Wildcard> wildcards_;
    std::unique_ptr<PathTree> general_;

    void insert(const std::vector<PathSegment>& segments,
                size_t pos,
                const std::string& path);
    static void descend(std::unique_ptr<PathTree>& slot,
                        const std::vector<PathSegment>& segments,
                        size_t pos,
                        const std::string& path);
    void marshal(std::string& b) const;
};

// One step from a parent node to a child during comparison.
struct KeyPathElement
{
    bool isIndex;
    std::string key;
    size_t index;

    KeyPathElement(const std::string& key) : isIndex(false), key(key), index(0)
    {
    }

    KeyPathElement(size_t index) : isIndex(true), index(index)
    {
    }
};

typedef std::vector<KeyPathElement> KeyPath;

// Renders a key path for messages, e.g. key1[0].key\.2
std::string formatKeyPath(const KeyPath& keyPath);

} // namespace jm

#endif // JSONMATCH_KEYPATH_H_
