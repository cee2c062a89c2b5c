#include "regwire/core/discovery.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>
#include <utility>

namespace regwire {

namespace {

constexpr size_t kContractArity = 2;

bool is_simple_identifier(std::string_view name) {
    return is_qualified_name(name) && name.find("::") == std::string_view::npos;
}

bool is_di_visible(accessibility access) noexcept {
    return access == accessibility::public_access || access == accessibility::internal_access;
}

bool has_usable_constructor(const type_decl& decl) noexcept {
    if (!decl.constructors) {
        return true;
    }
    return std::any_of(
        decl.constructors->begin(), decl.constructors->end(), [](const constructor_decl& c) {
            return !c.is_static && is_di_visible(c.access);
        });
}

struct reached_base {
    type_ref type;
    const base_entry* via;
};

struct contract_walk {
    const catalog& cat;
    const type_decl& contract;
    std::unordered_set<std::string> seen_interfaces;
    std::unordered_set<const type_decl*> active;
    std::vector<contract_instantiation> matches;

    contract_walk(const catalog& c, const type_decl& k) : cat(c), contract(k) {}

    const type_decl* lookup(const type_ref& ref) const {
        if (ref.is_fundamental || ref.is_type_parameter) {
            return nullptr;
        }
        return cat.find(ref.name);
    }

    // Declared interfaces come first, each followed by what it inherits; the
    // base class chain is walked afterwards.
    void visit_list(const std::vector<reached_base>& items) {
        for (const auto& item : items) {
            const type_decl* decl = lookup(item.type);
            if (decl && decl->kind == type_kind::interface_type) {
                visit_interface(item.type, *decl, item.via);
            }
        }
        for (const auto& item : items) {
            const type_decl* decl = lookup(item.type);
            if (decl && decl->kind != type_kind::interface_type) {
                visit_inherited(item.type, *decl, item.via);
            }
        }
    }

    void visit_interface(const type_ref& ref, const type_decl& decl, const base_entry* via) {
        if (!seen_interfaces.insert(display_name(ref)).second) {
            return;
        }
        if (&decl == &contract) {
            matches.push_back(contract_instantiation{&decl, ref.args, via});
        }
        visit_inherited(ref, decl, via);
    }

    // A generic base named without its full argument list does not resolve;
    // nothing is inherited through it.
    void visit_inherited(const type_ref& ref, const type_decl& decl, const base_entry* via) {
        if (ref.args.size() != decl.type_parameters.size()) {
            return;
        }
        if (!active.insert(&decl).second) {
            return;
        }
        std::vector<reached_base> items;
        items.reserve(decl.bases.size());
        for (const auto& entry : decl.bases) {
            auto base = parse_type_ref(entry.type, decl.type_parameters);
            if (!base) {
                continue;
            }
            *base = substitute(*base, decl.type_parameters, ref.args);
            items.push_back(reached_base{std::move(*base), via});
        }
        visit_list(items);
        active.erase(&decl);
    }
};

} // namespace

bool is_candidate(const type_decl& decl) noexcept {
    return decl.kind == type_kind::class_type && !decl.bases.empty();
}

std::optional<type_symbol> resolve_candidate(const type_decl& decl) {
    if (!is_qualified_name(decl.name)) {
        return std::nullopt;
    }
    for (const auto& param : decl.type_parameters) {
        if (!is_simple_identifier(param)) {
            return std::nullopt;
        }
    }

    type_symbol symbol;
    symbol.decl = &decl;
    if (decl.is_constructed()) {
        if (decl.type_arguments.size() != decl.type_parameters.size()) {
            return std::nullopt;
        }
        for (const auto& text : decl.type_arguments) {
            auto arg = parse_type_ref(text, decl.type_parameters);
            if (!arg) {
                return std::nullopt;
            }
            symbol.type_arguments.push_back(std::move(*arg));
        }
    } else {
        for (const auto& param : decl.type_parameters) {
            type_ref open;
            open.name = param;
            open.is_type_parameter = true;
            symbol.type_arguments.push_back(std::move(open));
        }
    }

    symbol.bases.reserve(decl.bases.size());
    for (const auto& entry : decl.bases) {
        auto base = parse_type_ref(entry.type, decl.type_parameters);
        if (!base) {
            return std::nullopt;
        }
        if (decl.is_constructed()) {
            *base = substitute(*base, decl.type_parameters, symbol.type_arguments);
        }
        symbol.bases.push_back(std::move(*base));
    }

    if (decl.is_abstract || decl.is_static) {
        return std::nullopt;
    }
    if (!is_di_visible(decl.access)) {
        return std::nullopt;
    }
    if (decl.is_unbound) {
        return std::nullopt;
    }
    if (std::any_of(symbol.type_arguments.begin(),
                    symbol.type_arguments.end(),
                    [](const type_ref& arg) { return contains_type_parameter(arg); })) {
        return std::nullopt;
    }
    if (!has_usable_constructor(decl)) {
        return std::nullopt;
    }

    type_ref self;
    self.name = std::string(normalize_qualified_name(decl.name));
    self.args = symbol.type_arguments;
    symbol.qualified_name = display_name(self);
    return symbol;
}

const type_decl* find_contract(const catalog& cat, std::string_view contract_name) {
    const type_decl* decl = cat.find(contract_name);
    if (!decl || decl->kind != type_kind::interface_type || decl->arity() != kContractArity) {
        return nullptr;
    }
    return decl;
}

std::vector<contract_instantiation>
match_contracts(const catalog& cat, const type_symbol& symbol, const type_decl& contract) {
    contract_walk walk(cat, contract);
    walk.active.insert(symbol.decl);

    std::vector<reached_base> items;
    items.reserve(symbol.bases.size());
    for (size_t i = 0; i < symbol.bases.size(); ++i) {
        items.push_back(reached_base{symbol.bases[i], &symbol.decl->bases[i]});
    }
    walk.visit_list(items);

    // Closed handlers only ever reach closed instantiations.
    std::erase_if(walk.matches, [](const contract_instantiation& m) {
        return std::any_of(m.type_arguments.begin(), m.type_arguments.end(), [](const type_ref& arg) {
            return contains_type_parameter(arg);
        });
    });
    return std::move(walk.matches);
}

source_location best_location(const type_decl& decl, const contract_instantiation& match) {
    if (match.via && match.via->location.valid()) {
        return match.via->location;
    }
    if (!decl.bases.empty() && decl.bases.front().location.valid()) {
        return decl.bases.front().location;
    }
    return decl.location;
}

} // namespace regwire
