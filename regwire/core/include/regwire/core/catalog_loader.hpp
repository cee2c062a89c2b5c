#pragma once

#include "catalog.hpp"
#include "result.hpp"

#include <string>
#include <string_view>

namespace regwire::catalog_io {

inline constexpr std::string_view kSupportedCatalogVersion = "1";

// Parses a JSON catalog document. On failure, error_detail (when given)
// receives a short description of where loading stopped.
result<catalog> load_from_string(std::string_view text, std::string* error_detail = nullptr);

result<catalog> load_from_file(const char* path, std::string* error_detail = nullptr);

} // namespace regwire::catalog_io
