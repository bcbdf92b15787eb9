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

#include <cxxopts.hpp>
#include <iostream>

#include "jsonskim/commands.hpp"
#include "jsonskim/version.hpp"

using namespace jsonskim;

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "jsonskim", "Extract named values from large JSON documents without a full parse");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("version", "Print version");
    opts("f,file", "JSON document to scan ('-' for stdin)",
         cxxopts::value<std::string>()->default_value("-"));
    opts("q,query", "Query as name=path (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("queries", "JSON file holding an object of name -> path", cxxopts::value<std::string>());
    opts("filters", "Apply [?key=value] array filters");
    opts("max-depth", "Maximum nesting depth to descend into",
         cxxopts::value<size_t>()->default_value("512"));
    opts("tree", "Print the compiled path tree and exit");
    opts("stats", "Print scan statistics to stderr");
    opts("v,verbose", "Verbose output");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  jsonskim -f doc.json -q id=meta.id           Single field" << std::endl;
            std::cout << "  jsonskim -f doc.json -q 'n=items[*].name'    Every element's name"
                      << std::endl;
            std::cout << "  jsonskim -f doc.json -q 'second=items[1]'    One array element"
                      << std::endl;
            std::cout << "  jsonskim -f doc.json --queries q.json        Queries from a file"
                      << std::endl;
            std::cout << "  jsonskim --filters -q 'b=items[?type=book].title' -f doc.json"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "jsonskim v" << VERSION_STRING << std::endl;
            return 0;
        }

        CommandOptions command;
        if (result.count("queries")) {
            command.queries = load_query_file(result["queries"].as<std::string>());
        }
        if (result.count("query")) {
            for (auto &[name, path] :
                 parse_query_args(result["query"].as<std::vector<std::string>>())) {
                command.queries[name] = path;
            }
        }

        if (result.count("tree")) {
            return cmd_tree(command.queries);
        }

        command.document_path = result["file"].as<std::string>();
        command.extractor.apply_filters = result.count("filters") > 0;
        command.extractor.max_depth = result["max-depth"].as<size_t>();
        command.extractor.verbose = result.count("verbose") > 0;
        command.print_stats = result.count("stats") > 0;

        return cmd_extract(command);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
