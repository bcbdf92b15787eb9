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

#include "path.hpp"
#include "scanner.hpp"
#include "types.hpp"
#include <string_view>
#include <vector>

namespace jsonskim {

// Extractor configuration
struct ExtractorConfig {
    bool verbose = false;

    // Evaluate "[?key=value]" filters against each element. When off, filters
    // are kept in the tree but every element passes.
    bool apply_filters = false;

    // Maximum container nesting the extractor descends into
    size_t max_depth = 512;
};

// Completion marker mirroring one PathNode. children[i] belongs to
// node.children[i]; the shape is fixed once built.
struct SatisfactionNode {
    bool complete = false;
    bool collects_all = false; // Wildcard/filtered array: only done once its array closes
    std::vector<SatisfactionNode> children;

    static SatisfactionNode build(const PathNode &node);

    // Set, or (unless collecting) at least one child and every child satisfied
    bool satisfied() const;
};

// Single-use extraction of the queries in a PathTree from one JSON buffer.
// Values in results() alias the buffer, which must outlive them.
class Extractor {
public:

    // data and tree are referenced, not copied: both must outlive the extractor
    // and every view in results()
    Extractor(std::string_view data, const PathTree &tree,
              const ExtractorConfig &config = ExtractorConfig{});
    Extractor(std::string_view data, PathTree &&tree,
              const ExtractorConfig &config = ExtractorConfig{}) = delete;

    // Scan until every query is satisfied or the document ends.
    // Throws ParseError on a structural error; results recorded so far remain.
    void extract();

    const Results &results() const { return results_; }

    // True once every query is satisfied; the scan stops at that point
    bool complete() const { return complete_; }

    // Bytes consumed by the scan
    size_t bytes_scanned() const { return scanner_.position(); }

    size_t values_recorded() const { return values_recorded_; }

    const SatisfactionNode &satisfaction() const { return satisfaction_; }

private:

    std::string_view data_;
    const PathTree &tree_;
    ExtractorConfig config_;
    Scanner scanner_;
    Results results_;
    SatisfactionNode satisfaction_;
    size_t values_recorded_ = 0;
    bool complete_ = false;
    bool started_ = false;

    void extract_object(const PathNode &node, SatisfactionNode &state, size_t depth);
    void extract_array(const PathNode &node, SatisfactionNode &state, size_t depth,
                       bool nested = false);

    // Record a value under every name of a terminal node
    void record(const PathNode &node, SatisfactionNode &state, std::string_view value,
                bool satisfies);

    // Mark an array node's branch done after its array closed
    void close_array(SatisfactionNode &state);

    // Recompute global completion from the top-level branches
    void update_complete();

    // Look ahead into the object element at the cursor without consuming it
    bool element_matches(const PathFilter &filter);

    void check_depth(size_t depth) const;
};

// Compile, extract and return the results in one call
Results extract(std::string_view data, const QueryMap &queries,
                const ExtractorConfig &config = ExtractorConfig{});

} // namespace jsonskim
