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

#include "jsonskim/path.hpp"
#include <charconv>
#include <sstream>

namespace jsonskim {

size_t PathNode::find_child(std::string_view child_key) const {
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i]->key == child_key) {
            return i;
        }
    }
    return NO_CHILD;
}

size_t PathNode::find_segment(std::string_view child_segment) const {
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i]->segment == child_segment) {
            return i;
        }
    }
    return NO_CHILD;
}

std::string PathNode::to_string() const {
    std::ostringstream oss;
    oss << "PathNode{Names: ";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0)
            oss << ",";
        oss << names[i];
    }
    oss << ", Key: " << key;
    oss << ", Filter: ";
    if (filter) {
        oss << filter->key << "=" << filter->value;
    }
    oss << ", ArrayIndex: " << array_index;
    oss << ", AsArray: " << (is_array ? "true" : "false");
    oss << "}";
    return oss.str();
}

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> segments;
    std::string current;
    int bracket_depth = 0;

    for (char c : path) {
        if (c == '[') {
            ++bracket_depth;
        } else if (c == ']' && bracket_depth > 0) {
            --bracket_depth;
        } else if (c == '.' && bracket_depth == 0) {
            segments.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    segments.push_back(current);
    return segments;
}

void parse_segment(const std::string &segment, PathNode &node) {
    size_t open = segment.find('[');
    if (open == std::string::npos) {
        // A plain field that meets an array reads its first element only
        node.key = segment;
        node.array_index = 0;
        return;
    }

    node.is_array = true;
    node.key = segment.substr(0, open);

    std::string spec = segment.substr(open + 1);
    if (!spec.empty() && spec.back() == ']') {
        spec.pop_back();
    }

    node.array_index = WILDCARD_INDEX;
    if (spec == "*") {
        return;
    }

    if (!spec.empty() && spec[0] == '?') {
        // Split on the first '='; a filter without one is a wildcard
        size_t eq = spec.find('=', 1);
        if (eq != std::string::npos) {
            node.filter = PathFilter{spec.substr(1, eq - 1), spec.substr(eq + 1)};
        }
        return;
    }

    int index = 0;
    const char *first = spec.data();
    if (spec.size() > 1 && spec[0] == '+') {
        ++first;
    }
    const char *last = spec.data() + spec.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec == std::errc() && ptr == last && index >= 0) {
        node.array_index = index;
    }
}

PathTree::PathTree() : root_(std::make_unique<PathNode>()) {}

PathTree PathTree::compile(const QueryMap &queries) {
    PathTree tree;
    for (const auto &[name, path] : queries) {
        tree.add_query(name, path);
    }
    return tree;
}

void PathTree::add_query(const std::string &name, const std::string &path) {
    PathNode *current = root_.get();

    // Lookup is by full segment text, so "items[0]" and "items[1]" become siblings
    for (const auto &segment : split_path(path)) {
        size_t idx = current->find_segment(segment);
        if (idx == PathNode::NO_CHILD) {
            auto child = std::make_unique<PathNode>();
            child->segment = segment;
            parse_segment(segment, *child);
            current->children.push_back(std::move(child));
            idx = current->children.size() - 1;
        }
        current = current->children[idx].get();
    }

    current->names.push_back(name);
    current->is_terminal = true;
    ++num_terminals_;
}

static size_t count_nodes(const PathNode &node) {
    size_t count = node.children.size();
    for (const auto &child : node.children) {
        count += count_nodes(*child);
    }
    return count;
}

size_t PathTree::node_count() const { return count_nodes(*root_); }

static void render_node(const PathNode &node, size_t depth, std::ostringstream &oss) {
    for (const auto &child : node.children) {
        oss << std::string(depth * 2, ' ') << child->segment;
        if (child->is_terminal) {
            oss << "  ->";
            for (const auto &name : child->names) {
                oss << " " << name;
            }
        }
        oss << "\n";
        render_node(*child, depth + 1, oss);
    }
}

std::string PathTree::to_string() const {
    std::ostringstream oss;
    oss << "(root) " << num_terminals_ << " queries, " << node_count() << " nodes\n";
    render_node(*root_, 1, oss);
    return oss.str();
}

} // namespace jsonskim
