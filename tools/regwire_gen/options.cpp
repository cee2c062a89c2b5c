#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace regwire_gen {

[[noreturn]] void print_usage() {
    std::cout << R"(regwire_gen - request handler registration generator

Usage:
  regwire_gen scan -i <catalog> -o <out_dir> [options]
  regwire_gen examples

Options:
  -i, --input <file>           Type catalog path (JSON)
  -o, --output <dir>           Output directory (default: .)
  --contract <name>            Handler contract (default: regwire::request_handler)
  --contract-header <path>     Header declaring the contract (default: regwire/runtime/request.hpp)
  --include <header>           Extra include for the generated header (repeatable)
  --namespace <ns>             Namespace of the generated code (default: regwire::generated)
  --timestamp                  Add an informational generation time line
  --json                       Print a JSON run summary to stdout
  --check                      Run discovery only, no files written
  --strict                     Fail when any diagnostic is reported
  --dump-catalog               Save catalog summary to catalog_summary.json
  -h, --help                   Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(regwire_gen examples:

  # Report discovered handlers and diagnostics only
  regwire_gen scan -i build/types.json --check --strict

  # Generate service_registration_extensions.hpp into gen/
  regwire_gen scan -i build/types.json -o gen

  # Custom contract and namespace
  regwire_gen scan -i build/types.json -o gen --contract app::command_handler \
      --contract-header app/command.hpp --namespace app::wiring

  # Dump the loaded catalog for debugging
  regwire_gen scan -i build/types.json -o gen --dump-catalog --json
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

    auto value_of = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            print_usage();
        }
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            opts.input = value_of(i);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = value_of(i);
        } else if (arg == "--contract") {
            opts.contract = value_of(i);
        } else if (arg == "--contract-header") {
            opts.contract_header = value_of(i);
        } else if (arg == "--include") {
            opts.includes.emplace_back(value_of(i));
        } else if (arg == "--namespace") {
            opts.target_namespace = value_of(i);
        } else if (arg == "--timestamp") {
            opts.timestamp = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--dump-catalog") {
            opts.dump_catalog = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace regwire_gen
