#pragma once

#include "catalog.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace regwire {

enum class diagnostic_id : uint8_t {
    missing_target_contract,
    arity_mismatch,
    duplicate_handler,
};

enum class severity : uint8_t { info, warning, error };

// Stable identifiers surfaced to the host ("missing-target-contract", ...).
inline constexpr std::string_view diagnostic_id_name(diagnostic_id id) noexcept {
    switch (id) {
    case diagnostic_id::missing_target_contract:
        return "missing-target-contract";
    case diagnostic_id::arity_mismatch:
        return "arity-mismatch";
    case diagnostic_id::duplicate_handler:
        return "duplicate-handler";
    }
    return "unknown";
}

inline constexpr std::string_view diagnostic_title(diagnostic_id id) noexcept {
    switch (id) {
    case diagnostic_id::missing_target_contract:
        return "Handler contract not found";
    case diagnostic_id::arity_mismatch:
        return "Invalid handler contract implementation";
    case diagnostic_id::duplicate_handler:
        return "Duplicate request handler";
    }
    return "Unknown diagnostic";
}

inline constexpr severity default_severity(diagnostic_id) noexcept {
    return severity::warning;
}

inline constexpr std::string_view severity_name(severity level) noexcept {
    switch (level) {
    case severity::info:
        return "info";
    case severity::warning:
        return "warning";
    case severity::error:
        return "error";
    }
    return "warning";
}

struct diagnostic {
    diagnostic_id id;
    severity level = severity::warning;
    std::string message;
    source_location location;
};

// Ordered collection of diagnostics produced by one run.
class diagnostic_bag {
public:
    void report(diagnostic_id id, std::string message, source_location location = {});

    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] size_t count(diagnostic_id id) const noexcept;

    [[nodiscard]] const diagnostic& operator[](size_t i) const noexcept { return items_[i]; }
    [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
    [[nodiscard]] auto end() const noexcept { return items_.end(); }

    void clear() noexcept { items_.clear(); }

private:
    std::vector<diagnostic> items_;
};

// "file:line:column: warning: message [duplicate-handler]"
std::string format_diagnostic(const diagnostic& d);

} // namespace regwire
