#pragma once

#include <string>
#include <vector>

namespace routegen_tool {

struct options {
    std::string subcommand;
    std::string input;
    std::string output = "-";            // "-" writes to stdout
    std::string emit = "header";         // expr,header
    std::string base;                    // default base expression override
    std::string binder_prefix;           // e.g. "router::"
    std::string ns;                      // namespace of the generated function
    std::string function = "build_routes";
    std::string return_type = "auto";
    std::string param;                   // parameter declaration of the generated function
    std::vector<std::string> includes;
    std::string dump_ast;                // path of the JSON route summary
    bool single_line = false;
    bool json_output = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace routegen_tool
