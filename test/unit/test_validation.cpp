#include "regwire/core/validation.hpp"
#include "support/catalog_builder.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using namespace regwire;
using namespace regwire::test_support;

namespace {

struct resolved {
    type_decl decl;
    type_decl contract = request_handler_contract();
};

type_symbol symbol_for(const type_decl& decl) {
    auto symbol = resolve_candidate(decl);
    EXPECT_TRUE(symbol.has_value());
    return symbol.value_or(type_symbol{});
}

contract_instantiation instantiation(const type_decl& contract,
                                     std::initializer_list<const char*> args,
                                     const base_entry* via = nullptr) {
    contract_instantiation m;
    m.origin = &contract;
    for (const char* a : args) {
        m.type_arguments.push_back(*parse_type_ref(a));
    }
    m.via = via;
    return m;
}

} // namespace

TEST(HandlerValidator, AcceptsWellFormedMatch) {
    diagnostic_bag diags;
    handler_validator validator(diags);
    resolved r{class_type("app::ping_handler").base("regwire::request_handler<app::ping, int>").build()};

    auto record = validator.accept(symbol_for(r.decl), instantiation(r.contract, {"app::ping", "int"}));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->handler_name, "::app::ping_handler");
    EXPECT_EQ(display_name(record->input), "::app::ping");
    EXPECT_EQ(display_name(record->output), "int");
    EXPECT_TRUE(diags.empty());
    EXPECT_EQ(validator.distinct_signatures(), 1U);
}

TEST(HandlerValidator, ArityMismatchIsDroppedWithDiagnostic) {
    diagnostic_bag diags;
    handler_validator validator(diags);
    resolved r{class_type("app::odd_handler")
                   .base_at("regwire::request_handler<app::ping>", "odd.hpp", 12, 26)
                   .at("odd.hpp", 12, 7)
                   .build()};

    auto record =
        validator.accept(symbol_for(r.decl), instantiation(r.contract, {"app::ping"}, &r.decl.bases[0]));
    EXPECT_FALSE(record.has_value());
    ASSERT_EQ(diags.size(), 1U);
    EXPECT_EQ(diags[0].id, diagnostic_id::arity_mismatch);
    EXPECT_EQ(diags[0].level, severity::warning);
    EXPECT_EQ(diags[0].message,
              "handler 'app::odd_handler' implements regwire::request_handler with 1 type arguments "
              "instead of 2");
    EXPECT_EQ(diags[0].location.file, "odd.hpp");
    EXPECT_EQ(diags[0].location.column, 26U);
    EXPECT_EQ(validator.distinct_signatures(), 0U);
}

TEST(HandlerValidator, DuplicateSignatureWarnsAndKeepsBoth) {
    diagnostic_bag diags;
    handler_validator validator(diags);
    resolved first{class_type("app::first_handler").base("regwire::request_handler<app::ping, int>").build()};
    resolved second{class_type("app::second_handler")
                        .base_at("regwire::request_handler<app::ping, int>", "second.hpp", 3, 30)
                        .build()};

    auto a = validator.accept(symbol_for(first.decl), instantiation(first.contract, {"app::ping", "int"}));
    auto b = validator.accept(symbol_for(second.decl),
                              instantiation(second.contract, {"::app::ping", "int"}, &second.decl.bases[0]));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(diags.size(), 1U);
    EXPECT_EQ(diags.count(diagnostic_id::duplicate_handler), 1U);
    EXPECT_EQ(diags[0].message,
              "multiple handlers found for request type 'app::ping' returning 'int'. Handler: "
              "'app::second_handler'");
    EXPECT_EQ(diags[0].location.line, 3U);
    EXPECT_EQ(validator.distinct_signatures(), 1U);
}

TEST(HandlerValidator, SameInputDifferentOutputIsNotDuplicate) {
    diagnostic_bag diags;
    handler_validator validator(diags);
    resolved r{class_type("app::h").base("regwire::request_handler<app::ping, int>").build()};
    auto symbol = symbol_for(r.decl);

    EXPECT_TRUE(validator.accept(symbol, instantiation(r.contract, {"app::ping", "int"})).has_value());
    EXPECT_TRUE(validator.accept(symbol, instantiation(r.contract, {"app::ping", "bool"})).has_value());
    EXPECT_TRUE(diags.empty());
    EXPECT_EQ(validator.distinct_signatures(), 2U);
}

TEST(Signature, UsesFullyQualifiedNames) {
    EXPECT_EQ(make_signature(*parse_type_ref("app::ping"), *parse_type_ref("std::vector<int>")),
              "::app::ping|::std::vector<int>");
}

TEST(SortRecords, OrdinalAndStable) {
    const std::vector<std::pair<std::string, std::string>> input = {
        {"::app::b_handler", "int"},
        {"::app::B_handler", "int"},
        {"::app::a_handler", "int"},
        {"::app::b_handler", "bool"},
        {"::app::\xC3\xA9_handler", "int"},
    };
    std::vector<handler_record> records;
    for (const auto& [name, output] : input) {
        handler_record r;
        r.handler_name = name;
        r.input = *parse_type_ref("int");
        r.output = *parse_type_ref(output);
        records.push_back(std::move(r));
    }

    sort_records(records);
    std::vector<std::string> names;
    for (const auto& r : records) {
        names.push_back(r.handler_name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"::app::B_handler", "::app::a_handler", "::app::b_handler",
                                               "::app::b_handler", "::app::\xC3\xA9_handler"}));
    // equal names keep their input order
    EXPECT_EQ(display_name(records[2].output), "int");
    EXPECT_EQ(display_name(records[3].output), "bool");
}

TEST(Diagnostics, FormatIncludesLocationAndId) {
    diagnostic d{diagnostic_id::duplicate_handler, severity::warning, "dup", {"h.hpp", 4, 9}};
    EXPECT_EQ(format_diagnostic(d), "h.hpp:4:9: warning: dup [duplicate-handler]");

    diagnostic no_loc{diagnostic_id::missing_target_contract, severity::warning, "missing", {}};
    EXPECT_EQ(format_diagnostic(no_loc), "warning: missing [missing-target-contract]");
}
