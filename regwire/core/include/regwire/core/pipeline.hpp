#pragma once

#include "cancellation.hpp"
#include "catalog.hpp"
#include "diagnostics.hpp"
#include "emitter.hpp"
#include "result.hpp"
#include "validation.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace regwire {

// Points at which a run checks its cancel token.
enum class pipeline_stage : uint8_t { resolve, match, emit };

struct pipeline_options {
    emit_options emit; // emit.contract_name also selects the contract to discover
    // Invoked at every checkpoint inside the run, right before the cancel
    // token is polled.
    std::function<void(pipeline_stage)> on_stage;
};

struct run_statistics {
    size_t types = 0;
    size_t candidates = 0;
    size_t eligible = 0;
    size_t matches = 0;
};

struct run_output {
    std::vector<handler_record> records; // sorted
    std::optional<generated_unit> unit;
    diagnostic_bag diagnostics;
    run_statistics stats;
};

// One pass over an immutable catalog: filter, resolve, match, validate, sort,
// emit. A cancelled run yields error_code::cancelled and nothing else.
result<run_output> run_pipeline(const catalog& cat,
                                const pipeline_options& opts,
                                const cancel_token* cancel = nullptr);

} // namespace regwire
