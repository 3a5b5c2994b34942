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

#include "keypath.h"

#include <climits>
#include <utility>

namespace jm {

namespace {

// Text of one dot-separated component, with the offset of every byte in
// the input path so errors can point at the right place.
struct Component
{
    std::string text;
    std::vector<size_t> offsets;
};

bool
isEscaped(const std::string& s, size_t i)
{
    return i > 0 && s[i - 1] == '\\';
}

std::vector<Component>
splitComponents(const std::string& path)
{
    std::vector<Component> components(1);
    bool escaped = false;
    for (size_t i = 0; i < path.size(); ++i) {
        char c = path[i];
        Component& cur = components.back();
        if (c == '\\') {
            escaped = true;
            cur.text += c;
            cur.offsets.push_back(i);
        } else if (c == '.') {
            if (escaped) {
                // "\." is a literal dot; drop the backslash
                cur.text.back() = '.';
                cur.offsets.back() = i;
                escaped = false;
            } else {
                components.emplace_back();
            }
        } else {
            escaped = false;
            cur.text += c;
            cur.offsets.push_back(i);
        }
    }
    return components;
}

size_t
offsetOf(const Component& comp, size_t i, size_t fallback)
{
    if (i < comp.offsets.size())
        return comp.offsets[i];
    if (!comp.offsets.empty())
        return comp.offsets.back();
    return fallback;
}

bool
parseIndex(const std::string& s, size_t& out)
{
    if (s.empty())
        return false;
    unsigned long long x = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        x = x * 10 + (c - '0');
        if (x > INT_MAX)
            return false;
    }
    out = x;
    return true;
}

PathSegment
parseGroup(const std::string& path,
           const Component& comp,
           size_t open,
           size_t close)
{
    std::string body = comp.text.substr(open + 1, close - open - 1);
    size_t where = offsetOf(comp, open, 0);
    size_t value = 0;
    PathSegment seg;
    bool valid = false;
    if (body == "*") {
        seg = PathSegment::makeIndex(0, WildcardKind::General);
        valid = true;
    } else if (!body.empty() && body.front() == '*') {
        if ((valid = parseIndex(body.substr(1), value)))
            seg = PathSegment::makeIndex(value, WildcardKind::Specific, true);
    } else if (!body.empty() && body.back() == '*') {
        if ((valid = parseIndex(body.substr(0, body.size() - 1), value)))
            seg = PathSegment::makeIndex(value, WildcardKind::Specific, false);
    } else if ((valid = parseIndex(body, value))) {
        seg = PathSegment::makeIndex(value, WildcardKind::None);
    }
    if (valid) {
        seg.pos = where;
        return seg;
    }
    std::string number = body;
    if (!number.empty() && number.front() == '*')
        number.erase(0, 1);
    else if (!number.empty() && number.back() == '*')
        number.pop_back();
    bool digits = !number.empty();
    for (char c : number)
        if (c < '0' || c > '9')
            digits = false;
    if (digits)
        throw KeyPathError(path, where, "array index out of range: [" + body + "]");
    throw KeyPathError(path, where, "invalid array index: [" + body + "]");
}

// Removes the escaping backslash from "\[" and "\]".
std::string
unescapeBrackets(const std::string& s)
{
    std::string r;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && (s[i + 1] == '[' || s[i + 1] == ']'))
            continue;
        r += s[i];
    }
    return r;
}

void
parseComponent(const std::string& path,
               const Component& comp,
               size_t start,
               std::vector<PathSegment>& out)
{
    const std::string& s = comp.text;
    std::vector<PathSegment> groups;
    size_t end = s.size();
    while (end > 0 && s[end - 1] == ']' && !isEscaped(s, end - 1)) {
        size_t close = end - 1;
        size_t open = std::string::npos;
        for (size_t i = close; i-- > 0;) {
            if (s[i] == '[' && !isEscaped(s, i)) {
                open = i;
                break;
            }
        }
        if (open == std::string::npos)
            throw KeyPathError(path, offsetOf(comp, close, start), "unbalanced ']'");
        groups.insert(groups.begin(), parseGroup(path, comp, open, close));
        end = open;
    }

    std::string key = s.substr(0, end);
    int depth = 0;
    for (size_t i = 0; i < key.size(); ++i) {
        if (isEscaped(key, i))
            continue;
        if (key[i] == '[') {
            ++depth;
        } else if (key[i] == ']') {
            if (--depth < 0)
                throw KeyPathError(path, offsetOf(comp, i, start), "unbalanced ']'");
        }
    }
    if (depth)
        throw KeyPathError(path, offsetOf(comp, key.rfind('['), start), "unbalanced '['");

    if (!key.empty() || groups.empty()) {
        out.push_back(PathSegment::makeKey(unescapeBrackets(key)));
        out.back().pos = offsetOf(comp, 0, start);
    }
    for (auto& group : groups)
        out.push_back(std::move(group));
}

std::string
indexToken(size_t i)
{
    return "[" + std::to_string(i) + "]";
}

} // namespace

KeyPathError::KeyPathError(const std::string& path,
                           size_t pos,
                           const std::string& what)
  : std::runtime_error("bad key path \"" + path + "\" at position " +
                       std::to_string(pos) + ": " + what),
    path_(path),
    pos_(pos)
{
}

PathSegment
PathSegment::makeKey(const std::string& name)
{
    PathSegment seg;
    seg.kind = Kind::Key;
    seg.name = name;
    seg.index = 0;
    seg.wildcard = WildcardKind::None;
    seg.starFirst = false;
    seg.pos = 0;
    return seg;
}

PathSegment
PathSegment::makeIndex(size_t index, WildcardKind wildcard, bool starFirst)
{
    PathSegment seg;
    seg.kind = Kind::Index;
    seg.index = index;
    seg.wildcard = wildcard;
    seg.starFirst = starFirst;
    seg.pos = 0;
    return seg;
}

std::string
PathSegment::token() const
{
    if (kind == Kind::Key)
        return name;
    switch (wildcard) {
        case WildcardKind::None:
            return indexToken(index);
        case WildcardKind::Specific:
            if (starFirst)
                return "[*" + std::to_string(index) + "]";
            return "[" + std::to_string(index) + "*]";
        case WildcardKind::General:
            return "[*]";
    }
    return std::string();
}

std::vector<PathSegment>
parseKeyPath(const std::string& path)
{
    std::vector<PathSegment> segments;
    std::vector<Component> components = splitComponents(path);
    size_t start = 0;
    for (const Component& comp : components) {
        parseComponent(path, comp, start, segments);
        if (!comp.offsets.empty())
            start = comp.offsets.back() + 1;
    }
    return segments;
}

std::unique_ptr<PathTree>
PathTree::build(const std::vector<std::string>& paths)
{
    if (paths.empty())
        return nullptr;
    std::vector<std::vector<PathSegment>> parsed;
    parsed.reserve(paths.size());
    for (const auto& path : paths)
        parsed.push_back(parseKeyPath(path));
    std::unique_ptr<PathTree> root(new PathTree);
    for (size_t i = 0; i < paths.size(); ++i)
        root->insert(parsed[i], 0, paths[i]);
    return root;
}

void
PathTree::descend(std::unique_ptr<PathTree>& slot,
                  const std::vector<PathSegment>& segments,
                  size_t pos,
                  const std::string& path)
{
    if (slot && slot->terminal_)
        return;
    if (pos + 1 == segments.size()) {
        slot.reset(new PathTree);
        slot->terminal_ = true;
        slot->path_ = path;
        return;
    }
    if (!slot)
        slot.reset(new PathTree);
    slot->insert(segments, pos + 1, path);
}

void
PathTree::insert(const std::vector<PathSegment>& segments,
                 size_t pos,
                 const std::string& path)
{
    const PathSegment& seg = segments[pos];
    if (seg.isKey()) {
        descend(keys_[seg.name], segments, pos, path);
        return;
    }
    switch (seg.wildcard) {
        case WildcardKind::None:
            descend(indices_[seg.index], segments, pos, path);
            break;
        case WildcardKind::Specific: {
            std::string token = seg.token();
            auto it = wildcards_.find(seg.index);
            if (it == wildcards_.end()) {
                it = wildcards_.emplace(seg.index, Wildcard{token, nullptr}).first;
            } else if (it->second.token != token) {
                throw KeyPathError(path, seg.pos,
                                   "duplicate wildcard index: " + token +
                                     " and " + it->second.token);
            }
            descend(it->second.tree, segments, pos, path);
            break;
        }
        case WildcardKind::General:
            descend(general_, segments, pos, path);
            break;
    }
}

const PathTree*
PathTree::key(const std::string& name) const
{
    auto it = keys_.find(name);
    return it == keys_.end() ? nullptr : it->second.get();
}

const PathTree*
PathTree::index(size_t i) const
{
    auto it = indices_.find(i);
    return it == indices_.end() ? nullptr : it->second.get();
}

const PathTree*
PathTree::wildcard(size_t i) const
{
    auto it = wildcards_.find(i);
    return it == wildcards_.end() ? nullptr : it->second.tree.get();
}

const PathTree*
PathTree::generalWildcard() const
{
    return general_.get();
}

std::string
PathTree::wildcardToken(size_t i) const
{
    auto it = wildcards_.find(i);
    return it == wildcards_.end() ? std::string() : it->second.token;
}

std::string
PathTree::toString() const
{
    std::string b;
    marshal(b);
    return b;
}

// Terminals print as their path; branches as {token=child, ...}.
void
PathTree::marshal(std::string& b) const
{
    if (terminal_) {
        b += path_;
        return;
    }
    bool once = false;
    auto entry = [&](const std::string& token, const PathTree* child) {
        if (once)
            b += ", ";
        once = true;
        b += token;
        b += '=';
        child->marshal(b);
    };
    b += '{';
    for (const auto& kv : keys_)
        entry(kv.first, kv.second.get());
    for (const auto& kv : indices_)
        entry(indexToken(kv.first), kv.second.get());
    for (const auto& kv : wildcards_)
        entry(kv.second.token, kv.second.tree.get());
    if (general_)
        entry("[*]", general_.get());
    b += '}';
}

std::string
formatKeyPath(const KeyPath& keyPath)
{
    std::string result;
    for (const auto& element : keyPath) {
        if (element.isIndex) {
            result += indexToken(element.index);
            continue;
        }
        if (!result.empty())
            result += '.';
        if (element.key.empty()) {
            result += "\"\"";
        } else {
            for (char c : element.key) {
                if (c == '.')
                    result += '\\';
                result += c;
            }
        }
    }
    return result;
}

} // namespace jm
