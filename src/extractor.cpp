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

#include "jsonskim/extractor.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace jsonskim {

SatisfactionNode SatisfactionNode::build(const PathNode &node) {
    SatisfactionNode state;
    state.collects_all = node.collects_all();
    state.children.reserve(node.children.size());
    for (const auto &child : node.children) {
        state.children.push_back(build(*child));
    }
    return state;
}

bool SatisfactionNode::satisfied() const {
    if (complete)
        return true;
    // A collecting array stays open until its array closes, whatever its children say
    if (collects_all || children.empty())
        return false;
    return std::all_of(children.begin(), children.end(),
                       [](const SatisfactionNode &child) { return child.satisfied(); });
}

Extractor::Extractor(std::string_view data, const PathTree &tree, const ExtractorConfig &config)
    : data_(data), tree_(tree), config_(config), scanner_(data),
      satisfaction_(SatisfactionNode::build(tree.root())) {}

void Extractor::extract() {
    if (started_) {
        throw std::logic_error("Extractor is single use; create a new one per document");
    }
    started_ = true;

    size_t offset = scanner_.position();
    Token token = scanner_.next();
    if (token.kind != TokenKind::StartObject && token.kind != TokenKind::StartArray) {
        throw ParseError(std::string("unexpected token ") + token_kind_to_string(token.kind) +
                             " at start of document",
                         offset);
    }

    const PathNode &root = tree_.root();
    if (root.children.empty()) {
        complete_ = true; // Nothing requested
    } else if (token.kind == TokenKind::StartObject) {
        extract_object(root, satisfaction_, 1);
    } else {
        extract_array(root, satisfaction_, 1);
    }

    if (config_.verbose) {
        std::cerr << "Extracted " << values_recorded_ << " values, scanned "
                  << scanner_.position() << " of " << data_.size() << " bytes"
                  << (complete_ ? " (stopped early, all queries satisfied)" : "") << std::endl;
    }
}

void Extractor::check_depth(size_t depth) const {
    if (depth > config_.max_depth) {
        throw ParseError("maximum nesting depth of " + std::to_string(config_.max_depth) +
                             " exceeded",
                         scanner_.position());
    }
}

void Extractor::extract_object(const PathNode &node, SatisfactionNode &state, size_t depth) {
    check_depth(depth);

    while (scanner_.more()) {
        std::string_view key = scanner_.expect_string();

        size_t idx = node.find_child(key);
        if (idx == PathNode::NO_CHILD) {
            scanner_.skip_value();
            continue;
        }

        const PathNode &child = *node.children[idx];
        SatisfactionNode &child_state = state.children[idx];

        size_t offset = scanner_.position();
        Token token = scanner_.next();
        switch (token.kind) {
        case TokenKind::StartObject:
            extract_object(child, child_state, depth + 1);
            break;
        case TokenKind::StartArray:
            extract_array(child, child_state, depth + 1);
            break;
        case TokenKind::String:
        case TokenKind::Number:
        case TokenKind::Boolean:
        case TokenKind::Null:
            // A scalar where a deeper path was expected is dropped
            if (child.is_terminal) {
                record(child, child_state, token.raw, !child.is_array);
            }
            break;
        default:
            throw ParseError(std::string("unexpected token ") + token_kind_to_string(token.kind) +
                                 " for key \"" + std::string(key) + "\"",
                             offset);
        }

        if (complete_)
            return;
    }

    scanner_.expect_end_object();
}

void Extractor::extract_array(const PathNode &node, SatisfactionNode &state, size_t depth,
                              bool nested) {
    check_depth(depth);

    bool single_element = !node.filter && node.array_index != WILDCARD_INDEX;
    int index = 0;

    while (scanner_.more()) {
        if (single_element && node.array_index != index) {
            scanner_.skip_value();
            ++index;
            continue;
        }

        if (node.filter && config_.apply_filters && !element_matches(*node.filter)) {
            scanner_.skip_value();
            ++index;
            continue;
        }

        size_t offset = scanner_.position();
        Token token = scanner_.next();
        switch (token.kind) {
        // Elements are matched against the same node, not a deeper level
        case TokenKind::StartObject:
            extract_object(node, state, depth + 1);
            break;
        case TokenKind::StartArray:
            extract_array(node, state, depth + 1, true);
            break;
        case TokenKind::String:
        case TokenKind::Number:
        case TokenKind::Boolean:
        case TokenKind::Null:
            if (node.is_terminal) {
                record(node, state, token.raw, !node.collects_all());
            }
            break;
        default:
            throw ParseError(std::string("unexpected token ") + token_kind_to_string(token.kind) +
                                 " in array",
                             offset);
        }

        if (complete_)
            return;

        ++index;
    }

    // Only the array that met the node closes its branch, not one nested as an element
    if (!nested)
        close_array(state);
    scanner_.expect_end_array();
}

void Extractor::record(const PathNode &node, SatisfactionNode &state, std::string_view value,
                       bool satisfies) {
    for (const auto &name : node.names) {
        results_[name].push_back(value);
    }
    ++values_recorded_;

    if (satisfies)
        state.complete = true;
    update_complete();
}

void Extractor::close_array(SatisfactionNode &state) {
    state.complete = true;
    update_complete();
}

void Extractor::update_complete() {
    const auto &branches = satisfaction_.children;
    complete_ = std::all_of(branches.begin(), branches.end(),
                            [](const SatisfactionNode &branch) { return branch.satisfied(); });
}

bool Extractor::element_matches(const PathFilter &filter) {
    size_t mark = scanner_.position();
    bool matched = false;

    if (scanner_.next().kind == TokenKind::StartObject) {
        while (scanner_.more()) {
            std::string_view key = scanner_.expect_string();
            if (key != filter.key) {
                scanner_.skip_value();
                continue;
            }
            Token value = scanner_.next();
            matched = is_scalar(value.kind) && value.raw == filter.value;
            break;
        }
    }

    scanner_.seek(mark);
    return matched;
}

Results extract(std::string_view data, const QueryMap &queries, const ExtractorConfig &config) {
    PathTree tree = PathTree::compile(queries);
    Extractor extractor(data, tree, config);
    extractor.extract();
    return extractor.results();
}

} // namespace jsonskim
