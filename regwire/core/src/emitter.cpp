#include "regwire/core/emitter.hpp"

#include <sstream>

namespace regwire {

namespace {

std::string include_line(std::string_view header) {
    std::string line = "#include ";
    if (header.starts_with('<')) {
        line += header;
    } else {
        line += '\"';
        line += header;
        line += '\"';
    }
    return line;
}

std::string contract_display_name(std::string_view contract_name) {
    return "::" + std::string(normalize_qualified_name(contract_name));
}

} // namespace

std::optional<generated_unit> emit_registration_unit(std::span<const handler_record> records,
                                                     const emit_options& opts) {
    if (records.empty()) {
        return std::nullopt;
    }

    const std::string contract = contract_display_name(opts.contract_name);
    const std::string_view ns = normalize_qualified_name(opts.target_namespace);

    std::ostringstream out;
    out << "// <auto-generated/>\n";
    out << "// Generated by " << kGeneratorName << " v" << kGeneratorVersion << "\n";
    if (opts.generation_time) {
        out << "// Generation time (informational): " << *opts.generation_time << "\n";
    }
    out << "// Handlers discovered: " << records.size() << "\n";
    out << "#pragma once\n\n";

    if (!opts.contract_header.empty()) {
        out << include_line(opts.contract_header) << "\n";
    }
    for (const auto& header : opts.extra_includes) {
        out << include_line(header) << "\n";
    }
    out << "\n";

    if (!ns.empty()) {
        out << "namespace " << ns << " {\n\n";
    }

    out << "// Registers all " << records.size()
        << " discovered request handlers as scoped services.\n";
    out << "struct " << kRegistrationUnitName << " {\n";
    out << "    template <typename Services> static Services& register_handlers(Services& "
           "services) {\n";
    for (const auto& record : records) {
        out << "        services.template add_scoped<" << contract << "<"
            << display_name(record.input) << ", " << display_name(record.output) << ">, "
            << record.handler_name << ">();\n";
    }
    out << "\n";
    out << "        return services;\n";
    out << "    }\n";
    out << "};\n\n";

    out << "template <typename Services> Services& register_handlers(Services& services) {\n";
    out << "    return " << kRegistrationUnitName << "::register_handlers(services);\n";
    out << "}\n";

    if (!ns.empty()) {
        out << "\n} // namespace " << ns << "\n";
    }

    generated_unit unit;
    unit.name = std::string(kRegistrationUnitName);
    unit.file_name = std::string(kRegistrationUnitName) + ".hpp";
    unit.text = out.str();
    unit.handler_count = records.size();
    return unit;
}

} // namespace regwire
