#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regwire {

// A parsed type expression such as "app::envelope<app::ping, std::string>*".
// Names are stored without a leading "::".
struct type_ref {
    std::string name;
    std::vector<type_ref> args;
    std::string suffix; // declarator tail: "*", "&", "[]", "[4]" ...
    bool is_type_parameter = false;
    bool is_fundamental = false;

    [[nodiscard]] bool is_generic() const noexcept { return !args.empty(); }

    friend bool operator==(const type_ref&, const type_ref&) = default;
};

bool is_fundamental_type_name(std::string_view name);

// Accepts "ident(::ident)*" with an optional leading "::".
bool is_qualified_name(std::string_view text);

// Drops a leading "::" and surrounding whitespace.
std::string_view normalize_qualified_name(std::string_view text) noexcept;

std::optional<type_ref> parse_type_ref(std::string_view text);

// Same as parse_type_ref, then flags every bare identifier listed in
// type_parameters as a type parameter.
std::optional<type_ref> parse_type_ref(std::string_view text,
                                       const std::vector<std::string>& type_parameters);

void mark_type_parameters(type_ref& ref, const std::vector<std::string>& type_parameters);

bool contains_type_parameter(const type_ref& ref) noexcept;

// Replaces type parameters named in params by the matching entry of args.
type_ref substitute(const type_ref& ref,
                    const std::vector<std::string>& params,
                    const std::vector<type_ref>& args);

// Fully-qualified form used in generated code and for identity:
// "::app::envelope<::app::ping, ::std::string>". Fundamental types and type
// parameters are written as is.
std::string display_name(const type_ref& ref);

// Form used in diagnostics, as written in the catalog: "app::envelope<app::ping, std::string>".
std::string written_name(const type_ref& ref);

} // namespace regwire
