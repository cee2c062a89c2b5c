#include "generator.hpp"

#include "regwire/core/serde.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace regwire_gen {

using regwire::serde::escape_json_string;

std::string dump_run_summary(const regwire::run_output& out) {
    std::ostringstream os;
    os << "{";
    os << "\"types\":" << out.stats.types << ",";
    os << "\"candidates\":" << out.stats.candidates << ",";
    os << "\"eligible\":" << out.stats.eligible << ",";
    os << "\"handlers\":[";
    bool first = true;
    for (const auto& record : out.records) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "{";
        os << "\"handler\":\"" << escape_json_string(record.handler_name) << "\",";
        os << "\"input\":\"" << escape_json_string(regwire::display_name(record.input)) << "\",";
        os << "\"output\":\"" << escape_json_string(regwire::display_name(record.output)) << "\"";
        os << "}";
    }
    os << "],";

    os << "\"diagnostics\":[";
    first = true;
    for (const auto& d : out.diagnostics) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "{";
        os << "\"id\":\"" << regwire::diagnostic_id_name(d.id) << "\",";
        os << "\"title\":\"" << regwire::diagnostic_title(d.id) << "\",";
        os << "\"severity\":\"" << regwire::severity_name(d.level) << "\",";
        os << "\"message\":\"" << escape_json_string(d.message) << "\",";
        os << "\"file\":\"" << escape_json_string(d.location.file) << "\",";
        os << "\"line\":" << d.location.line << ",";
        os << "\"column\":" << d.location.column;
        os << "}";
    }
    os << "]}";
    return os.str();
}

std::string format_generation_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";
    return os.str();
}

} // namespace regwire_gen
