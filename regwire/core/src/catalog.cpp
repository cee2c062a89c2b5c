#include "regwire/core/catalog.hpp"

#include "regwire/core/type_ref.hpp"

#include <utility>

namespace regwire {

std::string_view type_kind_name(type_kind kind) noexcept {
    switch (kind) {
    case type_kind::class_type:
        return "class";
    case type_kind::struct_type:
        return "struct";
    case type_kind::interface_type:
        return "interface";
    case type_kind::record_type:
        return "record";
    case type_kind::enum_type:
        return "enum";
    }
    return "class";
}

std::string_view accessibility_name(accessibility access) noexcept {
    switch (access) {
    case accessibility::public_access:
        return "public";
    case accessibility::internal_access:
        return "internal";
    case accessibility::protected_access:
        return "protected";
    case accessibility::private_access:
        return "private";
    case accessibility::protected_internal:
        return "protected internal";
    case accessibility::private_protected:
        return "private protected";
    }
    return "private";
}

std::optional<type_kind> type_kind_from_string(std::string_view sv) noexcept {
    if (sv == "class") {
        return type_kind::class_type;
    }
    if (sv == "struct") {
        return type_kind::struct_type;
    }
    if (sv == "interface") {
        return type_kind::interface_type;
    }
    if (sv == "record") {
        return type_kind::record_type;
    }
    if (sv == "enum") {
        return type_kind::enum_type;
    }
    return std::nullopt;
}

std::optional<accessibility> accessibility_from_string(std::string_view sv) noexcept {
    if (sv == "public") {
        return accessibility::public_access;
    }
    if (sv == "internal") {
        return accessibility::internal_access;
    }
    if (sv == "protected") {
        return accessibility::protected_access;
    }
    if (sv == "private") {
        return accessibility::private_access;
    }
    if (sv == "protected internal") {
        return accessibility::protected_internal;
    }
    if (sv == "private protected") {
        return accessibility::private_protected;
    }
    return std::nullopt;
}

std::string type_decl::identity() const {
    if (type_arguments.empty()) {
        return name;
    }
    std::string out = name;
    out += '<';
    for (size_t i = 0; i < type_arguments.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += type_arguments[i];
    }
    out += '>';
    return out;
}

type_decl* catalog::add_type(type_decl decl) {
    decl.name = std::string(normalize_qualified_name(decl.name));
    auto key = decl.identity();
    if (index_.contains(key)) {
        return nullptr;
    }
    index_.emplace(std::move(key), types_.size());
    types_.push_back(std::move(decl));
    return &types_.back();
}

const type_decl* catalog::find(std::string_view name) const {
    auto it = index_.find(std::string(normalize_qualified_name(name)));
    if (it == index_.end()) {
        return nullptr;
    }
    return &types_[it->second];
}

} // namespace regwire
