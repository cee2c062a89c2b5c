#include "regwire/core/pipeline.hpp"

#include "regwire/core/discovery.hpp"

#include <utility>

namespace regwire {

namespace {

bool cancelled(const pipeline_options& opts, pipeline_stage stage, const cancel_token* cancel) {
    if (opts.on_stage) {
        opts.on_stage(stage);
    }
    return cancel && cancel->is_cancellation_requested();
}

} // namespace

result<run_output> run_pipeline(const catalog& cat,
                                const pipeline_options& opts,
                                const cancel_token* cancel) {
    if (cancel && cancel->is_cancellation_requested()) {
        return std::unexpected(make_error_code(error_code::cancelled));
    }

    run_output out;
    out.stats.types = cat.size();

    // Per-type stages: no state shared between declarations.
    std::vector<type_symbol> eligible;
    for (const auto& decl : cat.types()) {
        if (cancelled(opts, pipeline_stage::resolve, cancel)) {
            return std::unexpected(make_error_code(error_code::cancelled));
        }
        if (!is_candidate(decl)) {
            continue;
        }
        ++out.stats.candidates;
        if (auto symbol = resolve_candidate(decl)) {
            eligible.push_back(std::move(*symbol));
        }
    }
    out.stats.eligible = eligible.size();
    if (eligible.empty()) {
        return out;
    }

    const type_decl* contract = find_contract(cat, opts.emit.contract_name);
    if (!contract) {
        out.diagnostics.report(diagnostic_id::missing_target_contract,
                               "contract '" + std::string(normalize_qualified_name(
                                                  opts.emit.contract_name)) +
                                   "' with two type parameters could not be found in the "
                                   "catalog; ensure the contract declaration is part of the "
                                   "scanned types");
        return out;
    }

    // Barrier: the signature set spans every accepted record of the run.
    handler_validator validator(out.diagnostics);
    for (const auto& symbol : eligible) {
        if (cancelled(opts, pipeline_stage::match, cancel)) {
            return std::unexpected(make_error_code(error_code::cancelled));
        }
        for (const auto& match : match_contracts(cat, symbol, *contract)) {
            ++out.stats.matches;
            if (auto record = validator.accept(symbol, match)) {
                out.records.push_back(std::move(*record));
            }
        }
    }

    if (out.records.empty()) {
        return out;
    }

    sort_records(out.records);
    if (cancelled(opts, pipeline_stage::emit, cancel)) {
        return std::unexpected(make_error_code(error_code::cancelled));
    }
    out.unit = emit_registration_unit(out.records, opts.emit);
    return out;
}

} // namespace regwire
