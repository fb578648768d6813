#include "routegen/core/codegen.hpp"
#include "routegen/core/parser.hpp"
#include "routegen/generator.hpp"
#include "routegen/options.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using routegen::route_definition;
using namespace routegen_tool;

namespace {

bool write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[routegen] failed to create " << path.parent_path() << ": "
                      << ec.message() << "\n";
            return false;
        }
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cerr << "[routegen] failed to write " << path << "\n";
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

std::optional<route_definition> load(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[routegen] input file is required\n";
        return std::nullopt;
    }
    auto source = read_source(opts.input);
    if (!source) {
        std::cerr << "[routegen] failed to read " << opts.input << ": " << source.error().message()
                  << "\n";
        return std::nullopt;
    }
    auto parsed = routegen::parse_routes(*source);
    if (!parsed) {
        std::cerr << parsed.error().format(opts.input, *source);
        return std::nullopt;
    }
    return std::move(*parsed);
}

int run_generate(const options& opts) {
    if (opts.emit != "expr" && opts.emit != "header") {
        std::cerr << "[routegen] unknown emit mode: " << opts.emit << " (expected: expr|header)\n";
        return 1;
    }

    auto def = load(opts);
    if (!def) {
        return 1;
    }

    routegen::codegen_options codegen;
    if (!opts.base.empty()) {
        codegen.default_base = opts.base;
    }
    codegen.binder_prefix = opts.binder_prefix;
    codegen.multiline = !opts.single_line;

    std::string code;
    if (opts.emit == "expr") {
        code = routegen::generate_chain(*def, codegen) + "\n";
    } else {
        header_options header;
        header.source_name = fs::path(opts.input).filename().string();
        header.ns = opts.ns;
        header.function = opts.function;
        header.return_type = opts.return_type;
        header.param = opts.param;
        header.includes = opts.includes;
        code = generate_header(*def, header, codegen);
    }

    if (opts.output.empty() || opts.output == "-") {
        std::cout << code;
    } else {
        if (!write_file(opts.output, code)) {
            return 1;
        }
        std::cout << "[codegen] Route table written to " << opts.output << " ("
                  << def->table.size() << " routes)\n";
    }

    if (!opts.dump_ast.empty()) {
        if (!write_file(opts.dump_ast, dump_ast_summary(*def))) {
            return 1;
        }
        std::cerr << "[routegen] AST summary written to " << opts.dump_ast << "\n";
    }
    return 0;
}

int run_check(const options& opts) {
    auto def = load(opts);
    if (!def) {
        return 1;
    }
    if (opts.json_output) {
        std::cout << dump_ast_summary(*def) << "\n";
    }
    std::cout << "[check] OK: routes=" << def->table.size()
              << ", base=" << (def->base ? "explicit" : "default") << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand == "generate") {
        return run_generate(opts);
    }
    if (opts.subcommand == "check") {
        return run_check(opts);
    }
    std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
    print_usage();
}
