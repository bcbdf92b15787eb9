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

#include "jsonskim/commands.hpp"
#include "jsonskim/path.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace jsonskim {

QueryMap parse_query_args(const std::vector<std::string> &args) {
    QueryMap queries;
    for (const auto &arg : args) {
        size_t eq = arg.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
            throw std::invalid_argument("Invalid query (expected name=path): " + arg);
        }
        std::string name = arg.substr(0, eq);
        if (!queries.emplace(name, arg.substr(eq + 1)).second) {
            throw std::invalid_argument("Duplicate query name: " + name);
        }
    }
    return queries;
}

QueryMap load_query_file(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open query file: " + filepath);
    }

    json j = json::parse(file);
    if (!j.is_object()) {
        throw std::runtime_error("Query file must hold a JSON object of name -> path: " +
                                 filepath);
    }

    QueryMap queries;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error("Query \"" + it.key() + "\" in " + filepath +
                                     " is not a string path");
        }
        queries[it.key()] = it.value().get<std::string>();
    }
    return queries;
}

std::string read_document(const std::string &filepath) {
    if (filepath == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open document file: " + filepath);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Every declared query appears in the output, empty when nothing matched
json results_to_json(const Results &results, const QueryMap &queries) {
    json j = json::object();
    for (const auto &[name, path] : queries) {
        json values = json::array();
        auto it = results.find(name);
        if (it != results.end()) {
            for (const auto &value : it->second) {
                values.push_back(std::string(value));
            }
        }
        j[name] = values;
    }
    return j;
}

int cmd_extract(const CommandOptions &options) {
    if (options.queries.empty()) {
        std::cerr << "Error: no queries given (use --query or --queries)" << std::endl;
        return 1;
    }

    std::string document;
    try {
        document = read_document(options.document_path);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    PathTree tree = PathTree::compile(options.queries);
    Extractor extractor(document, tree, options.extractor);

    int status = 0;
    try {
        extractor.extract();
    } catch (const ParseError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    // Partial results are still printed after a structural error
    std::cout << results_to_json(extractor.results(), options.queries)
                     .dump(2, ' ', false, json::error_handler_t::replace)
              << std::endl;

    if (options.print_stats) {
        std::cerr << "Scanned " << extractor.bytes_scanned() << " of " << document.size()
                  << " bytes, " << extractor.values_recorded() << " values"
                  << (extractor.complete() ? ", stopped early" : "") << std::endl;
    }

    return status;
}

int cmd_tree(const QueryMap &queries) {
    PathTree tree = PathTree::compile(queries);
    std::cout << tree.to_string();
    return 0;
}

} // namespace jsonskim
