#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace regwire {

enum class type_kind : uint8_t { class_type, struct_type, interface_type, record_type, enum_type };

enum class accessibility : uint8_t {
    public_access,
    internal_access,
    protected_access,
    private_access,
    protected_internal,
    private_protected,
};

std::string_view type_kind_name(type_kind kind) noexcept;
std::string_view accessibility_name(accessibility access) noexcept;
std::optional<type_kind> type_kind_from_string(std::string_view sv) noexcept;
std::optional<accessibility> accessibility_from_string(std::string_view sv) noexcept;

struct source_location {
    std::string file;
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] bool valid() const noexcept { return !file.empty() || line != 0; }
};

struct constructor_decl {
    accessibility access = accessibility::public_access;
    bool is_static = false;
};

// One clause of a declaration's base list, kept as written.
struct base_entry {
    std::string type;
    source_location location;
};

struct type_decl {
    std::string name; // qualified, without leading "::"
    type_kind kind = type_kind::class_type;
    accessibility access = accessibility::public_access;
    bool is_abstract = false;
    bool is_static = false;
    bool is_sealed = false;
    bool is_unbound = false;
    std::vector<std::string> type_parameters;
    std::vector<std::string> type_arguments; // set only for constructed entries
    std::vector<base_entry> bases;
    // nullopt: nothing declared, the implicit public instance constructor applies
    std::optional<std::vector<constructor_decl>> constructors;
    source_location location;

    [[nodiscard]] size_t arity() const noexcept { return type_parameters.size(); }
    [[nodiscard]] bool is_generic() const noexcept { return !type_parameters.empty(); }
    [[nodiscard]] bool is_constructed() const noexcept { return !type_arguments.empty(); }

    // Unique key inside a catalog: the name, plus "<args>" for constructed entries.
    [[nodiscard]] std::string identity() const;
};

// Immutable snapshot of declared types once loading finishes.
class catalog {
public:
    catalog() = default;

    catalog(const catalog&) = default;
    catalog& operator=(const catalog&) = default;
    catalog(catalog&&) noexcept = default;
    catalog& operator=(catalog&&) noexcept = default;

    // Returns nullptr when a declaration with the same identity exists.
    type_decl* add_type(type_decl decl);

    // Generic definitions and non-generic types, looked up by qualified name.
    [[nodiscard]] const type_decl* find(std::string_view name) const;

    [[nodiscard]] const std::vector<type_decl>& types() const noexcept { return types_; }
    [[nodiscard]] size_t size() const noexcept { return types_.size(); }
    [[nodiscard]] bool empty() const noexcept { return types_.empty(); }

    std::string version = "1";

private:
    std::vector<type_decl> types_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace regwire
