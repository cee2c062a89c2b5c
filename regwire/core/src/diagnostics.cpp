#include "regwire/core/diagnostics.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace regwire {

void diagnostic_bag::report(diagnostic_id id, std::string message, source_location location) {
    items_.push_back(diagnostic{id, default_severity(id), std::move(message), std::move(location)});
}

size_t diagnostic_bag::count(diagnostic_id id) const noexcept {
    return static_cast<size_t>(std::count_if(
        items_.begin(), items_.end(), [id](const diagnostic& d) { return d.id == id; }));
}

std::string format_diagnostic(const diagnostic& d) {
    std::ostringstream os;
    if (d.location.valid()) {
        os << (d.location.file.empty() ? "<catalog>" : d.location.file);
        if (d.location.line != 0) {
            os << ":" << d.location.line;
            if (d.location.column != 0) {
                os << ":" << d.location.column;
            }
        }
        os << ": ";
    }
    os << severity_name(d.level) << ": " << d.message << " [" << diagnostic_id_name(d.id) << "]";
    return os.str();
}

} // namespace regwire
