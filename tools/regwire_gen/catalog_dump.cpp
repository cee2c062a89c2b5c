#include "generator.hpp"

#include "regwire/core/serde.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace regwire_gen {

using regwire::serde::escape_json_string;

namespace {

void write_location(std::ostringstream& os, const regwire::source_location& loc) {
    if (!loc.valid()) {
        os << "null";
        return;
    }
    os << "{\"file\":\"" << escape_json_string(loc.file) << "\",\"line\":" << loc.line
       << ",\"column\":" << loc.column << "}";
}

void write_string_array(std::ostringstream& os, const std::vector<std::string>& items) {
    os << "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "\"" << escape_json_string(item) << "\"";
    }
    os << "]";
}

} // namespace

std::string dump_catalog_summary(const regwire::catalog& cat) {
    std::ostringstream os;
    os << "{";
    os << "\"catalog\":\"" << escape_json_string(cat.version) << "\",";
    os << "\"types\":[";
    bool first_type = true;
    for (const auto& decl : cat.types()) {
        if (!first_type) {
            os << ",";
        }
        first_type = false;
        os << "{";
        os << "\"name\":\"" << escape_json_string(decl.identity()) << "\",";
        os << "\"kind\":\"" << regwire::type_kind_name(decl.kind) << "\",";
        os << "\"access\":\"" << regwire::accessibility_name(decl.access) << "\",";
        os << "\"abstract\":" << (decl.is_abstract ? "true" : "false") << ",";
        os << "\"static\":" << (decl.is_static ? "true" : "false") << ",";
        os << "\"unbound\":" << (decl.is_unbound ? "true" : "false") << ",";
        os << "\"type_parameters\":";
        write_string_array(os, decl.type_parameters);
        os << ",";

        os << "\"bases\":[";
        bool first_base = true;
        for (const auto& base : decl.bases) {
            if (!first_base) {
                os << ",";
            }
            first_base = false;
            os << "{\"type\":\"" << escape_json_string(base.type) << "\",\"location\":";
            write_location(os, base.location);
            os << "}";
        }
        os << "],";

        os << "\"constructors\":";
        if (!decl.constructors) {
            os << "null";
        } else {
            os << "[";
            bool first_ctor = true;
            for (const auto& ctor : *decl.constructors) {
                if (!first_ctor) {
                    os << ",";
                }
                first_ctor = false;
                os << "{\"access\":\"" << regwire::accessibility_name(ctor.access)
                   << "\",\"static\":" << (ctor.is_static ? "true" : "false") << "}";
            }
            os << "]";
        }
        os << ",\"location\":";
        write_location(os, decl.location);
        os << "}";
    }
    os << "]}";
    return os.str();
}

} // namespace regwire_gen
