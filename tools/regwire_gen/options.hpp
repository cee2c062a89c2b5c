#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace regwire_gen {

struct options {
    std::string subcommand;
    std::string input;
    std::filesystem::path output = ".";
    std::string contract = "regwire::request_handler";
    std::string contract_header = "regwire/runtime/request.hpp";
    std::vector<std::string> includes;
    std::string target_namespace = "regwire::generated";
    bool timestamp = false;
    bool strict = false;
    bool dump_catalog = false;
    bool json_output = false;
    bool check_only = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace regwire_gen
