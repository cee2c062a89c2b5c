#pragma once

#include "validation.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regwire {

inline constexpr std::string_view kGeneratorName = "regwire_gen";
inline constexpr std::string_view kGeneratorVersion = "1.0.0";
inline constexpr std::string_view kRegistrationUnitName = "service_registration_extensions";
inline constexpr std::string_view kDefaultContractName = "regwire::request_handler";
inline constexpr std::string_view kDefaultContractHeader = "regwire/runtime/request.hpp";
inline constexpr std::string_view kDefaultNamespace = "regwire::generated";

struct emit_options {
    std::string contract_name{kDefaultContractName};
    std::string contract_header{kDefaultContractHeader};
    std::vector<std::string> extra_includes; // "<map>" kept as is, others quoted
    std::string target_namespace{kDefaultNamespace}; // empty: global namespace
    // Informational only; excluded from the reproducibility contract.
    std::optional<std::string> generation_time;
};

struct generated_unit {
    std::string name;
    std::string file_name;
    std::string text;
    size_t handler_count = 0;
};

// Renders the registration header. Records must already be sorted. Returns
// nullopt for an empty record set.
std::optional<generated_unit> emit_registration_unit(std::span<const handler_record> records,
                                                     const emit_options& opts);

} // namespace regwire
