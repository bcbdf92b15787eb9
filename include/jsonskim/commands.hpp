#pragma once

#include "extractor.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace jsonskim {

using json = nlohmann::json;

// Options collected from the command line
struct CommandOptions {
    std::string document_path;  // "-" reads stdin
    QueryMap queries;
    ExtractorConfig extractor;
    bool print_stats = false;
};

// Command handlers
int cmd_extract(const CommandOptions &options);
int cmd_tree(const QueryMap &queries);

// Helper functions
QueryMap parse_query_args(const std::vector<std::string> &args);
QueryMap load_query_file(const std::string &filepath);
std::string read_document(const std::string &filepath);
json results_to_json(const Results &results, const QueryMap &queries);

} // namespace jsonskim
