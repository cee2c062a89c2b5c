#include "regwire/core/validation.hpp"

#include <algorithm>
#include <utility>

namespace regwire {

namespace {

constexpr size_t kExpectedTypeArguments = 2;

std::string contract_written_name(const contract_instantiation& match) {
    return match.origin ? match.origin->name : std::string("contract");
}

} // namespace

std::string make_signature(const type_ref& input, const type_ref& output) {
    return display_name(input) + "|" + display_name(output);
}

std::optional<handler_record> handler_validator::accept(const type_symbol& symbol,
                                                        const contract_instantiation& match) {
    const type_decl& decl = *symbol.decl;
    if (match.type_arguments.size() != kExpectedTypeArguments) {
        diagnostics_.report(diagnostic_id::arity_mismatch,
                            "handler '" + decl.identity() + "' implements " +
                                contract_written_name(match) + " with " +
                                std::to_string(match.type_arguments.size()) +
                                " type arguments instead of 2",
                            best_location(decl, match));
        return std::nullopt;
    }

    handler_record record{&decl, symbol.qualified_name, match.type_arguments[0],
                          match.type_arguments[1]};

    if (!seen_.insert(make_signature(record.input, record.output)).second) {
        diagnostics_.report(diagnostic_id::duplicate_handler,
                            "multiple handlers found for request type '" +
                                written_name(record.input) + "' returning '" +
                                written_name(record.output) + "'. Handler: '" + decl.identity() +
                                "'",
                            best_location(decl, match));
    }
    return record;
}

void sort_records(std::vector<handler_record>& records) {
    // char_traits<char> compares as unsigned char, so this is byte-wise ordinal.
    std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        return a.handler_name < b.handler_name;
    });
}

} // namespace regwire
