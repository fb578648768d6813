#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace routegen_tool {

[[noreturn]] void print_usage() {
    std::cout << R"(routegen: route table compiler

Usage:
  routegen generate -i <file.routes> [-o <out>] [options]
  routegen check -i <file.routes> [--json]
  routegen examples

Options:
  -i, --input <file>         Route definition file
  -o, --output <file>        Output file, '-' for stdout (default: -)
  --emit <mode>              What to generate: expr,header (default: header)
  --base <expr>              Starting expression when the file has none (default: route())
  --binder-prefix <prefix>   Qualifier for the first method binder, e.g. router::
  --namespace <ns>           Namespace of the generated function (header mode)
  --function <name>          Generated function name (default: build_routes)
  --return-type <type>       Generated function return type (default: auto)
  --param <decl>             Generated function parameter, e.g. "router r"
  --include <header>         Add an #include to the generated header (repeatable)
  --single-line              Emit the builder chain on one line
  --dump-ast <file>          Save a JSON summary of the parsed routes
  --json                     Print the JSON summary (check)
  -h, --help                 Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(routegen examples:

  # Validate a route file only
  routegen check -i api.routes

  # Generate a header with build_routes() in namespace app
  routegen generate -i api.routes -o gen/api_routes.hpp --namespace app --include "router.hpp"

  # Emit the bare expression, chaining onto a parameter
  routegen generate -i api.routes --emit expr --base r

  # Dump the parsed table for debugging
  routegen check -i api.routes --json
)";
    std::exit(0);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    if (opts.subcommand == "examples") {
        print_examples();
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage();
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            opts.input = value();
        } else if (arg == "-o" || arg == "--output") {
            opts.output = value();
        } else if (arg == "--emit") {
            opts.emit = value();
        } else if (arg == "--base") {
            opts.base = value();
        } else if (arg == "--binder-prefix") {
            opts.binder_prefix = value();
        } else if (arg == "--namespace") {
            opts.ns = value();
        } else if (arg == "--function") {
            opts.function = value();
        } else if (arg == "--return-type") {
            opts.return_type = value();
        } else if (arg == "--param") {
            opts.param = value();
        } else if (arg == "--include") {
            opts.includes.emplace_back(value());
        } else if (arg == "--dump-ast") {
            opts.dump_ast = value();
        } else if (arg == "--single-line") {
            opts.single_line = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace routegen_tool
