// Copyright 2025 Siddhant Biradar
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

#pragma once

#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonskim {

// Array element filter from a "field[?key=value]" segment
struct PathFilter {
    std::string key;
    std::string value;
};

// One level of the compiled query tree
struct PathNode {
    static constexpr size_t NO_CHILD = SIZE_MAX;

    std::string segment;            // Raw segment text, bracket suffix included
    std::string key;                // Field name matched against document keys
    std::vector<std::string> names; // Query names reported here (terminal nodes)
    std::vector<std::unique_ptr<PathNode>> children;
    std::optional<PathFilter> filter;
    int array_index = WILDCARD_INDEX;
    bool is_array = false;
    bool is_terminal = false;

    // Index of the first child whose key equals the given bytes, or NO_CHILD
    size_t find_child(std::string_view child_key) const;

    // Index of the child compiled from exactly this segment text, or NO_CHILD
    size_t find_segment(std::string_view child_segment) const;

    // True for array nodes that collect every qualifying element
    bool collects_all() const { return is_array && (filter || array_index == WILDCARD_INDEX); }

    std::string to_string() const;
};

// Query tree compiled from a set of named dot paths.
// Queries sharing a prefix share the nodes for that prefix.
class PathTree {
public:

    PathTree();

    // Compile "name -> path" queries, e.g. {"names", "items[*].n"}
    static PathTree compile(const QueryMap &queries);

    const PathNode &root() const { return *root_; }

    // Number of queries compiled into the tree
    size_t num_terminals() const { return num_terminals_; }

    // Nodes below the root
    size_t node_count() const;

    // Indented rendering of the whole tree
    std::string to_string() const;

private:

    std::unique_ptr<PathNode> root_;
    size_t num_terminals_ = 0;

    void add_query(const std::string &name, const std::string &path);
};

// Split a path on '.' outside of brackets
std::vector<std::string> split_path(const std::string &path);

// Apply a "field[spec]" segment's array addressing to a node
void parse_segment(const std::string &segment, PathNode &node);

} // namespace jsonskim
