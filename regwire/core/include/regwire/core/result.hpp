#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace regwire {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    catalog_parse_error = 1,
    catalog_invalid = 2,
    cancelled = 3,
    io_error = 4,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "regwire"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::catalog_parse_error:
            return "failed to parse type catalog";
        case ec::catalog_invalid:
            return "invalid or unsupported type catalog";
        case ec::cancelled:
            return "operation cancelled";
        case ec::io_error:
            return "i/o error";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace regwire

namespace std {
template <> struct is_error_code_enum<regwire::error_code> : true_type {};
} // namespace std
