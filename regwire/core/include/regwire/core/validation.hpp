#pragma once

#include "diagnostics.hpp"
#include "discovery.hpp"
#include "type_ref.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace regwire {

// An accepted (handler, input, output) triple destined for registration.
struct handler_record {
    const type_decl* handler = nullptr;
    std::string handler_name; // fully qualified
    type_ref input;
    type_ref output;
};

// Duplicate-detection key: "<input>|<output>", both fully qualified.
std::string make_signature(const type_ref& input, const type_ref& output);

// Checks contract arity and tracks (input, output) signatures across one run.
// Duplicates are reported but still accepted; the container decides which
// registration wins.
class handler_validator {
public:
    explicit handler_validator(diagnostic_bag& diagnostics) : diagnostics_(diagnostics) {}

    handler_validator(const handler_validator&) = delete;
    handler_validator& operator=(const handler_validator&) = delete;

    std::optional<handler_record> accept(const type_symbol& symbol,
                                         const contract_instantiation& match);

    [[nodiscard]] size_t distinct_signatures() const noexcept { return seen_.size(); }

private:
    diagnostic_bag& diagnostics_;
    std::unordered_set<std::string> seen_;
};

// Stable ordinal sort on the handler's fully-qualified name.
void sort_records(std::vector<handler_record>& records);

} // namespace regwire
