#include "regwire/core/catalog_loader.hpp"
#include "regwire/core/pipeline.hpp"
#include "regwire/core/type_ref.hpp"
#include "regwire_gen/generator.hpp"
#include "regwire_gen/options.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using regwire::error_code;
using namespace regwire_gen;

namespace {

std::string error_message(const std::error_code& ec) {
    switch (static_cast<error_code>(ec.value())) {
    case error_code::catalog_parse_error:
        return "failed to parse type catalog";
    case error_code::catalog_invalid:
        return "invalid type catalog";
    case error_code::io_error:
        return "failed to read type catalog";
    default:
        return ec.message();
    }
}

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

int run_scan(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[scan] input catalog is required\n";
        return 1;
    }
    if (!regwire::is_qualified_name(opts.contract)) {
        std::cerr << "[scan] invalid contract name: " << opts.contract << "\n";
        return 1;
    }
    if (!opts.target_namespace.empty() && !regwire::is_qualified_name(opts.target_namespace)) {
        std::cerr << "[scan] invalid namespace: " << opts.target_namespace << "\n";
        return 1;
    }

    if (!opts.check_only || opts.dump_catalog) {
        std::error_code fs_ec;
        fs::create_directories(opts.output, fs_ec);
        if (fs_ec) {
            std::cerr << "[scan] failed to create output dir: " << fs_ec.message() << "\n";
            return 1;
        }
    }

    std::string detail;
    auto loaded = regwire::catalog_io::load_from_file(opts.input.c_str(), &detail);
    if (!loaded) {
        std::cerr << "[catalog] " << error_message(loaded.error());
        if (!detail.empty()) {
            std::cerr << ": " << detail;
        }
        std::cerr << "\n";
        return 1;
    }
    const regwire::catalog& cat = *loaded;

    if (opts.dump_catalog) {
        auto dump_path = opts.output / "catalog_summary.json";
        if (!write_file(dump_path, dump_catalog_summary(cat))) {
            std::cerr << "[catalog] failed to write " << dump_path << "\n";
            return 1;
        }
        std::cout << "[catalog] summary written to " << dump_path << "\n";
    }

    regwire::pipeline_options popts;
    popts.emit.contract_name = opts.contract;
    popts.emit.contract_header = opts.contract_header;
    popts.emit.extra_includes = opts.includes;
    popts.emit.target_namespace = opts.target_namespace;
    if (opts.timestamp) {
        popts.emit.generation_time = format_generation_time(std::chrono::system_clock::now());
    }

    auto ran = regwire::run_pipeline(cat, popts);
    if (!ran) {
        std::cerr << "[scan] " << ran.error().message() << "\n";
        return 1;
    }
    const regwire::run_output& out = *ran;

    for (const auto& d : out.diagnostics) {
        std::cerr << regwire::format_diagnostic(d) << "\n";
    }

    if (opts.json_output) {
        std::cout << dump_run_summary(out) << "\n";
    }

    if (opts.check_only) {
        std::cout << "[check] OK: handlers=" << out.records.size()
                  << ", diagnostics=" << out.diagnostics.size() << "\n";
    } else if (out.unit) {
        auto unit_path = opts.output / out.unit->file_name;
        if (!write_file(unit_path, out.unit->text)) {
            std::cerr << "[codegen] failed to write " << unit_path << "\n";
            return 1;
        }
        std::cout << "[codegen] Registrations written to " << unit_path << "\n";
    } else {
        std::cout << "[codegen] no handlers discovered, nothing written\n";
    }

    std::cout << "[scan] OK: types=" << out.stats.types << ", candidates=" << out.stats.candidates
              << ", handlers=" << out.records.size() << ", diagnostics=" << out.diagnostics.size()
              << "\n";

    if (opts.strict && !out.diagnostics.empty()) {
        std::cerr << "[scan] strict mode: " << out.diagnostics.size() << " diagnostic(s) reported\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand != "scan") {
        std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
        print_usage();
    }
    return run_scan(opts);
}
