#pragma once

#include "catalog.hpp"
#include "type_ref.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regwire {

// An eligible declaration with its base list resolved into type expressions.
struct type_symbol {
    const type_decl* decl = nullptr;
    std::vector<type_ref> type_arguments;
    std::vector<type_ref> bases; // parallel to decl->bases, type parameters substituted
    std::string qualified_name;  // "::app::ping_handler", "::app::box_handler<int>"
};

struct contract_instantiation {
    const type_decl* origin = nullptr;
    std::vector<type_ref> type_arguments;
    // Base clause of the handler through which the contract was reached, if any.
    const base_entry* via = nullptr;
};

// Syntactic pre-filter: a class that lists at least one base.
bool is_candidate(const type_decl& decl) noexcept;

// Applies the eligibility rules in order. Rejection is silent.
std::optional<type_symbol> resolve_candidate(const type_decl& decl);

// The contract declaration: an interface with exactly two type parameters.
const type_decl* find_contract(const catalog& cat, std::string_view contract_name);

// Every instantiation of `contract` the symbol implements, directly or through
// its base classes and inherited interfaces. Interfaces reached twice are
// reported once.
std::vector<contract_instantiation>
match_contracts(const catalog& cat, const type_symbol& symbol, const type_decl& contract);

// Declaration location of the base clause the instantiation came through,
// falling back to the first base clause, then to the type's own location.
source_location best_location(const type_decl& decl, const contract_instantiation& match);

} // namespace regwire
