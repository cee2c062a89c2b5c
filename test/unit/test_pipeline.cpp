#include "regwire/core/pipeline.hpp"
#include "support/catalog_builder.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using namespace regwire;
using namespace regwire::test_support;

namespace {

result<run_output> run(const catalog& cat) {
    return run_pipeline(cat, pipeline_options{});
}

std::vector<std::string> handler_names(const run_output& out) {
    std::vector<std::string> names;
    for (const auto& r : out.records) {
        names.push_back(r.handler_name);
    }
    return names;
}

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(Pipeline, EmptyCatalogProducesNothing) {
    auto res = run(catalog{});
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->unit.has_value());
    EXPECT_TRUE(res->records.empty());
    EXPECT_TRUE(res->diagnostics.empty());
}

TEST(Pipeline, CatalogWithoutCandidatesIsSilentEvenWithoutContract) {
    auto cat = catalog_builder().add(class_type("app::plain")).add(interface_type("app::i")).build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->unit.has_value());
    EXPECT_TRUE(res->diagnostics.empty());
    EXPECT_EQ(res->stats.types, 2U);
    EXPECT_EQ(res->stats.candidates, 0U);
}

TEST(Pipeline, SingleHandler) {
    auto cat = catalog_builder().with_contract().handler("app::handler_a", "app::req", "std::string").build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_TRUE(res->diagnostics.empty());
    EXPECT_EQ(res->unit->handler_count, 1U);
    EXPECT_EQ(count_occurrences(res->unit->text, "add_scoped<"), 1U);
    EXPECT_NE(res->unit->text.find(
                  "add_scoped<::regwire::request_handler<::app::req, ::std::string>, ::app::handler_a>();"),
              std::string::npos);
}

TEST(Pipeline, HandlersAreOrderedByQualifiedName) {
    auto cat = catalog_builder()
                   .with_contract()
                   .handler("app::h2", "app::req_b", "int")
                   .handler("app::h1", "app::req_a", "std::string")
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{"::app::h1", "::app::h2"}));
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_LT(res->unit->text.find("::app::h1>"), res->unit->text.find("::app::h2>"));
}

TEST(Pipeline, DuplicateSignatureKeepsBothAndReportsSecond) {
    auto cat = catalog_builder()
                   .with_contract()
                   .handler("app::h1", "app::req", "std::string")
                   .handler("app::h2", "app::req", "std::string")
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{"::app::h1", "::app::h2"}));
    ASSERT_EQ(res->diagnostics.size(), 1U);
    EXPECT_EQ(res->diagnostics[0].id, diagnostic_id::duplicate_handler);
    EXPECT_NE(res->diagnostics[0].message.find("Handler: 'app::h2'"), std::string::npos);
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_EQ(count_occurrences(res->unit->text, "add_scoped<"), 2U);
}

TEST(Pipeline, OpenGenericIsRejectedSilently) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::open_handler")
                            .params({"T"})
                            .base("regwire::request_handler<app::wrapper<T>, std::string>"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->unit.has_value());
    EXPECT_TRUE(res->diagnostics.empty());
    EXPECT_EQ(res->stats.candidates, 1U);
    EXPECT_EQ(res->stats.eligible, 0U);
}

TEST(Pipeline, OnlyConcreteSubclassOfAbstractHandlerRegisters) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::abstract_handler")
                            .abstract()
                            .base("regwire::request_handler<app::req, std::string>"))
                   .add(class_type("app::concrete_handler").base("app::abstract_handler"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{"::app::concrete_handler"}));
    EXPECT_TRUE(res->diagnostics.empty());
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_NE(res->unit->text.find(
                  "add_scoped<::regwire::request_handler<::app::req, ::std::string>, ::app::concrete_handler>"),
              std::string::npos);
    EXPECT_EQ(res->unit->text.find("::app::abstract_handler>"), std::string::npos);
}

TEST(Pipeline, MissingContractIsReportedOnce) {
    auto cat = catalog_builder()
                   .handler("app::h1", "app::req", "int")
                   .handler("app::h2", "app::other", "int")
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->unit.has_value());
    ASSERT_EQ(res->diagnostics.size(), 1U);
    EXPECT_EQ(res->diagnostics[0].id, diagnostic_id::missing_target_contract);
    EXPECT_FALSE(res->diagnostics[0].location.valid());
    EXPECT_NE(res->diagnostics[0].message.find("'regwire::request_handler'"), std::string::npos);
}

TEST(Pipeline, ArityMismatchDropsOnlyThatHandler) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::bad").base("regwire::request_handler<app::req>"))
                   .handler("app::good", "app::req", "int")
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{"::app::good"}));
    EXPECT_EQ(res->diagnostics.count(diagnostic_id::arity_mismatch), 1U);
}

TEST(Pipeline, CustomContractName) {
    auto cat = catalog_builder()
                   .add(request_handler_contract("bus::handles"))
                   .add(class_type("app::h").base("bus::handles<app::req, int>"))
                   .build();
    pipeline_options opts;
    opts.emit.contract_name = "::bus::handles";
    auto res = run_pipeline(cat, opts);
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_NE(res->unit->text.find("add_scoped<::bus::handles<::app::req, int>, ::app::h>();"),
              std::string::npos);
}

TEST(Pipeline, SupplementedShapes) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::outer::nested_handler").base("regwire::request_handler<app::a, int>"))
                   .add(class_type("app::outer::private_handler")
                            .access(accessibility::private_access)
                            .base("regwire::request_handler<app::b, int>"))
                   .add(class_type("app::outer::internal_handler")
                            .access(accessibility::internal_access)
                            .base("regwire::request_handler<app::c, int>"))
                   .add(class_type("app::sealed_handler").sealed().base("regwire::request_handler<app::d, int>"))
                   .add(class_type("app::static_holder").static_class().base("regwire::request_handler<app::e, int>"))
                   .handler("global_handler", "app::f", "std::tuple<int, std::string>")
                   .handler("app::list_handler", "app::g", "std::vector<app::item>")
                   .handler("app::maybe_handler", "app::h", "std::optional<int>")
                   .handler("app::array_handler", "app::i", "int[]")
                   .add(class_type("app::generic_handler").params({"T"}).base("regwire::request_handler<T, bool>"))
                   .add(class_type("app::int_handler").base("app::generic_handler<int>"))
                   .add(class_type("app::no_bases"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->diagnostics.empty());
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{
                                       "::app::array_handler",
                                       "::app::int_handler",
                                       "::app::list_handler",
                                       "::app::maybe_handler",
                                       "::app::outer::internal_handler",
                                       "::app::outer::nested_handler",
                                       "::app::sealed_handler",
                                       "::global_handler",
                                   }));
    ASSERT_TRUE(res->unit.has_value());
    const auto& text = res->unit->text;
    EXPECT_NE(text.find("<::regwire::request_handler<::app::f, ::std::tuple<int, ::std::string>>, ::global_handler>"),
              std::string::npos);
    EXPECT_NE(text.find("<::regwire::request_handler<::app::i, int[]>, ::app::array_handler>"), std::string::npos);
    EXPECT_NE(text.find("<::regwire::request_handler<int, bool>, ::app::int_handler>"), std::string::npos);
}

TEST(Pipeline, MultipleContractImplementationsYieldOneRecordEach) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::multi")
                            .base("regwire::request_handler<app::a, int>")
                            .base("regwire::request_handler<app::b, int>"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res->records.size(), 2U);
    EXPECT_EQ(display_name(res->records[0].input), "::app::a");
    EXPECT_EQ(display_name(res->records[1].input), "::app::b");
}

TEST(Pipeline, OutputIsIndependentOfDeclarationOrder) {
    auto forward = catalog_builder()
                       .with_contract()
                       .handler("app::c", "app::x", "int")
                       .handler("app::a", "app::y", "int")
                       .handler("app::b", "app::z", "int")
                       .build();
    auto reversed = catalog_builder()
                        .handler("app::b", "app::z", "int")
                        .handler("app::a", "app::y", "int")
                        .handler("app::c", "app::x", "int")
                        .with_contract()
                        .build();
    auto first = run(forward);
    auto second = run(reversed);
    auto again = run(forward);
    ASSERT_TRUE(first && second && again);
    ASSERT_TRUE(first->unit && second->unit && again->unit);
    EXPECT_EQ(first->unit->text, second->unit->text);
    EXPECT_EQ(first->unit->text, again->unit->text);
}

TEST(Pipeline, EveryRecordIsSound) {
    auto cat = catalog_builder()
                   .with_contract()
                   .handler("app::h1", "app::a", "int")
                   .add(class_type("app::abstract_h").abstract().base("regwire::request_handler<app::b, int>"))
                   .add(class_type("app::private_h")
                            .access(accessibility::private_access)
                            .base("regwire::request_handler<app::c, int>"))
                   .add(class_type("app::ctorless_h")
                            .ctor(accessibility::private_access)
                            .base("regwire::request_handler<app::d, int>"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    for (const auto& r : res->records) {
        ASSERT_NE(r.handler, nullptr);
        EXPECT_FALSE(r.handler->is_abstract);
        EXPECT_FALSE(r.handler->is_static);
        EXPECT_TRUE(r.handler->access == accessibility::public_access ||
                    r.handler->access == accessibility::internal_access);
    }
    EXPECT_EQ(handler_names(*res), (std::vector<std::string>{"::app::h1"}));
}

TEST(Pipeline, GenericBaseWithoutArgumentsEmitsNothing) {
    auto cat = catalog_builder()
                   .with_contract()
                   .add(class_type("app::generic_base")
                            .abstract()
                            .params({"T"})
                            .base("regwire::request_handler<T, int>"))
                   .add(class_type("app::concrete").base("app::generic_base"))
                   .build();
    auto res = run(cat);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->records.empty());
    EXPECT_TRUE(res->diagnostics.empty());
    EXPECT_FALSE(res->unit.has_value());
}

TEST(Pipeline, CancelledBeforeStart) {
    auto cat = catalog_builder().with_contract().handler("app::h", "app::a", "int").build();
    cancel_token token;
    token.request_cancel();
    auto res = run_pipeline(cat, pipeline_options{}, &token);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(error_code::cancelled));
}

namespace {

// Two handlers for the same signature: a run that completes reports one
// duplicate-handler diagnostic, so any result of a cancelled run would carry it.
catalog duplicate_pair() {
    return catalog_builder()
        .with_contract()
        .handler("app::first_handler", "app::ping", "std::string")
        .handler("app::second_handler", "app::ping", "std::string")
        .build();
}

result<run_output> run_cancelling_at(const catalog& cat, pipeline_stage stage, int nth) {
    cancel_token token;
    int seen = 0;
    pipeline_options opts;
    opts.on_stage = [&](pipeline_stage s) {
        if (s == stage && ++seen == nth) {
            token.request_cancel();
        }
    };
    return run_pipeline(cat, opts, &token);
}

} // namespace

TEST(Pipeline, StagesAreObservedInOrder) {
    auto cat = duplicate_pair();
    std::vector<pipeline_stage> stages;
    pipeline_options opts;
    opts.on_stage = [&](pipeline_stage s) { stages.push_back(s); };
    auto res = run_pipeline(cat, opts);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->diagnostics.size(), 1U);
    EXPECT_EQ(stages,
              (std::vector<pipeline_stage>{pipeline_stage::resolve,
                                           pipeline_stage::resolve,
                                           pipeline_stage::resolve,
                                           pipeline_stage::match,
                                           pipeline_stage::match,
                                           pipeline_stage::emit}));
}

TEST(Pipeline, CancelledWhileResolvingDeclarations) {
    auto res = run_cancelling_at(duplicate_pair(), pipeline_stage::resolve, 2);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(error_code::cancelled));
}

TEST(Pipeline, CancelledWhileMatchingAfterFirstRecord) {
    auto res = run_cancelling_at(duplicate_pair(), pipeline_stage::match, 2);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(error_code::cancelled));
}

TEST(Pipeline, CancelledBeforeEmitDiscardsDiagnostics) {
    auto res = run_cancelling_at(duplicate_pair(), pipeline_stage::emit, 1);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(error_code::cancelled));
}

TEST(Pipeline, UncancelledTokenDoesNotInterfere) {
    auto cat = catalog_builder().with_contract().handler("app::h", "app::a", "int").build();
    cancel_token token;
    auto res = run_pipeline(cat, pipeline_options{}, &token);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->records.size(), 1U);
}

TEST(Pipeline, ThousandHandlersCompleteQuickly) {
    catalog_builder builder;
    builder.with_contract();
    for (int i = 0; i < 1000; ++i) {
        char name[64];
        std::snprintf(name, sizeof(name), "app::handler_%04d", i);
        builder.handler(name, "app::request_" + std::to_string(i), "std::vector<int>");
    }
    auto cat = builder.build();

    auto start = std::chrono::steady_clock::now();
    auto res = run(cat);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->records.size(), 1000U);
    EXPECT_TRUE(res->diagnostics.empty());
    ASSERT_TRUE(res->unit.has_value());
    EXPECT_EQ(res->unit->handler_count, 1000U);
    EXPECT_EQ(res->records.front().handler_name, "::app::handler_0000");
    EXPECT_EQ(res->records.back().handler_name, "::app::handler_0999");
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 5000);
}
