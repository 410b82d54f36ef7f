#include "stuckrank/scorer.hpp"

#include "program_fixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace stuckrank::scorer::test {

namespace {

using program::CallKind;
using program::ProgramView;
using stuckrank::test::call_stmt;
using stuckrank::test::klass;
using stuckrank::test::line;
using stuckrank::test::method;
using stuckrank::test::module;
using stuckrank::test::sig;
using stuckrank::test::span_stmt;
using stuckrank::test::stmt;

/// View, call graph and ICFG for one synthetic program.
class Fixture
{
public:
    Fixture(program::ProgramModule program_module, const char* entry)
        : m_modules{std::move(program_module)}
        , m_view(ProgramView::build(m_modules))
    {
        const std::vector<program::MethodQuery> entries{program::parse_method_query(entry).value()};
        m_icfg = std::make_unique<icfg::Icfg>(m_view, callgraph::build_call_graph(m_view, entries).value());
    }

    [[nodiscard]] const ProgramView& view() const { return m_view; }
    [[nodiscard]] const icfg::Icfg& graph() const { return *m_icfg; }

private:
    std::vector<program::ProgramModule> m_modules;
    ProgramView m_view;
    std::unique_ptr<icfg::Icfg> m_icfg;
};

/**
 * fuzz calls helper from two lines; helper calls leaf. Both callers reach
 * the same callee closure.
 *
 *   Main.fuzz: m0 (5) -> m1 (6, call helper) -> m2 (7) -> m3 (8, call helper) -> m4 (9)
 *              m0 -> m4
 *   Util.helper: h0 (20) -> h1 (21, call leaf) -> h2 (22)
 *   Util.leaf:   l0 (30) -> l1 (31)
 */
program::ProgramModule shared_callee_module()
{
    return module(
        "shared",
        {klass("demo.Main",
               {method("fuzz",
                       {stmt("m0", 5, {"m1", "m4"}),
                        call_stmt("m1", 6, CallKind::kStatic, sig("demo.Util", "helper"), {"m2"}),
                        stmt("m2", 7, {"m3"}),
                        call_stmt("m3", 8, CallKind::kStatic, sig("demo.Util", "helper"), {"m4"}),
                        stmt("m4", 9)},
                       "void",
                       {"byte[]"})}),
         klass("demo.Util",
               {method("helper",
                       {stmt("h0", 20, {"h1"}),
                        call_stmt("h1", 21, CallKind::kStatic, sig("demo.Util", "leaf"), {"h2"}),
                        stmt("h2", 22)}),
                method("leaf", {stmt("l0", 30, {"l1"}), stmt("l1", 31)})})});
}

coverage::CoverageTable shared_callee_coverage()
{
    coverage::CoverageTable table;
    table.insert(line("demo.Main", 5, 2, 3, 1, 2));
    table.insert(line("demo.Main", 6, 1, 2));
    table.insert(line("demo.Main", 7, 0, 1));
    table.insert(line("demo.Main", 8, 1, 2));
    table.insert(line("demo.Main", 9, 1, 1));
    table.insert(line("demo.Util", 20, 1, 1));
    table.insert(line("demo.Util", 21, 1, 2));
    table.insert(line("demo.Util", 22, 0, 1));
    table.insert(line("demo.Util", 30, 0, 1));
    table.insert(line("demo.Util", 31, 0, 1));
    return table;
}

}  // namespace

TEST(ReachabilityScorerTest, CountsUncoveredStatementsAcrossCalls)
{
    const Fixture fixture(stuckrank::test::caller_callee_module(), "demo.A.fuzz");
    const auto coverage = stuckrank::test::caller_callee_coverage();
    const ReachabilityScorer scorer(fixture.graph(), coverage);

    const auto point = line("demo.A", 10, 1, 3, 1, 2);
    const auto outcome = scorer.evaluate(point);
    EXPECT_EQ(outcome.score, 8U);
    EXPECT_EQ(outcome.reached, 8U);
    EXPECT_EQ(outcome.seeds, 1U);
    EXPECT_FALSE(outcome.truncated);
    EXPECT_EQ(outcome.limit, BudgetLimit::kNone);
    EXPECT_EQ(scorer.score(point), 8U);
}

TEST(ReachabilityScorerTest, FullyCoveredStatementsDoNotCount)
{
    const Fixture fixture(stuckrank::test::caller_callee_module(), "demo.A.fuzz");
    coverage::CoverageTable coverage;
    coverage.insert(line("demo.A", 12, 1, 1));
    const auto base = stuckrank::test::caller_callee_coverage();
    for (const auto& [klass_name, lines] : base.classes()) {
        for (const auto& [number, entry] : lines) {
            coverage.insert(entry);
        }
    }
    const ReachabilityScorer scorer(fixture.graph(), coverage);
    EXPECT_EQ(scorer.score(line("demo.A", 10, 1, 3, 1, 2)), 7U);
}

TEST(ReachabilityScorerTest, LineWithoutStatementsScoresZero)
{
    const Fixture fixture(stuckrank::test::caller_callee_module(), "demo.A.fuzz");
    const auto coverage = stuckrank::test::caller_callee_coverage();
    const ReachabilityScorer scorer(fixture.graph(), coverage);

    const auto outcome = scorer.evaluate(line("demo.A", 99, 1, 2));
    EXPECT_EQ(outcome.score, 0U);
    EXPECT_EQ(outcome.seeds, 0U);
    EXPECT_EQ(scorer.score(line("demo.Unknown", 10, 1, 2)), 0U);
}

TEST(ReachabilityScorerTest, RecursionTerminates)
{
    const Fixture fixture(
        module("recursion",
               {klass("demo.Even",
                      {method("test",
                              {call_stmt("e0", 5, CallKind::kStatic, sig("demo.Odd", "test", "boolean", {"int"}),
                                         {"e1"}),
                               stmt("e1", 6)},
                              "boolean",
                              {"int"})}),
                klass("demo.Odd",
                      {method("test",
                              {call_stmt("o0", 9, CallKind::kStatic, sig("demo.Even", "test", "boolean", {"int"}),
                                         {"o1"}),
                               stmt("o1", 10)},
                              "boolean",
                              {"int"})})}),
        "demo.Even.test");
    coverage::CoverageTable coverage;
    coverage.insert(line("demo.Even", 5, 1, 2));
    coverage.insert(line("demo.Even", 6, 0, 1));
    coverage.insert(line("demo.Odd", 9, 0, 2));
    coverage.insert(line("demo.Odd", 10, 0, 1));

    for (const bool memoize : {true, false}) {
        const ReachabilityScorer scorer(fixture.graph(), coverage, ScorerConfig{.memoize_callees = memoize});
        EXPECT_EQ(scorer.score(line("demo.Even", 5, 1, 2)), 4U) << "memoize=" << memoize;
    }
}

TEST(ReachabilityScorerTest, ScoresAreIdempotent)
{
    const Fixture fixture(shared_callee_module(), "demo.Main.fuzz");
    const auto coverage = shared_callee_coverage();
    const ReachabilityScorer first(fixture.graph(), coverage);
    const ReachabilityScorer second(fixture.graph(), coverage);

    for (const auto& point : coverage::select_stuck_points(coverage)) {
        const auto expected = first.score(point);
        EXPECT_EQ(first.score(point), expected);
        EXPECT_EQ(second.score(point), expected);
    }
}

TEST(ReachabilityScorerTest, MemoizedClosuresMatchPlainTraversal)
{
    const Fixture fixture(shared_callee_module(), "demo.Main.fuzz");
    const auto coverage = shared_callee_coverage();
    const ReachabilityScorer memoized(fixture.graph(), coverage, ScorerConfig{.memoize_callees = true});
    const ReachabilityScorer plain(fixture.graph(), coverage, ScorerConfig{.memoize_callees = false});

    const auto points = coverage::select_stuck_points(coverage);
    ASSERT_EQ(points.size(), 4U);
    for (const auto& point : points) {
        const auto lhs = memoized.evaluate(point);
        const auto rhs = plain.evaluate(point);
        EXPECT_EQ(lhs.score, rhs.score) << point.class_fqn() << ":" << point.line();
        EXPECT_EQ(lhs.reached, rhs.reached) << point.class_fqn() << ":" << point.line();
    }

    // m0 reaches all of fuzz, helper and leaf; m4 and h0 are fully covered.
    EXPECT_EQ(memoized.score(line("demo.Main", 5, 2, 3, 1, 2)), 8U);
    // h1 reaches h1, h2, l0, l1.
    EXPECT_EQ(memoized.score(line("demo.Util", 21, 1, 2)), 4U);
}

TEST(ReachabilityScorerTest, MoreCoverageNeverRaisesScores)
{
    const Fixture fixture(shared_callee_module(), "demo.Main.fuzz");
    const auto base = shared_callee_coverage();

    coverage::CoverageTable extended;
    extended.insert(line("demo.Util", 30, 1, 1));
    extended.insert(line("demo.Main", 7, 1, 1));
    for (const auto& [klass_name, lines] : base.classes()) {
        for (const auto& [number, entry] : lines) {
            extended.insert(entry);
        }
    }

    const ReachabilityScorer before(fixture.graph(), base);
    const ReachabilityScorer after(fixture.graph(), extended);
    for (const auto& point : coverage::select_stuck_points(base)) {
        EXPECT_LE(after.score(point), before.score(point)) << point.class_fqn() << ":" << point.line();
    }
    EXPECT_LT(after.score(line("demo.Main", 5, 2, 3, 1, 2)),
              before.score(line("demo.Main", 5, 2, 3, 1, 2)));
}

TEST(ReachabilityScorerTest, MultiLineStatementsUseAnyCoveredLine)
{
    const Fixture fixture(
        module("spans",
               {klass("demo.C",
                      {method("fuzz",
                              {span_stmt("a", 30, 32, {"n"}), stmt("n", 0, {"z"}), stmt("z", 33)},
                              "void",
                              {"byte[]"})})}),
        "demo.C.fuzz");
    coverage::CoverageTable coverage;
    coverage.insert(line("demo.C", 30, 1, 2));
    coverage.insert(line("demo.C", 31, 1, 1));
    coverage.insert(line("demo.C", 33, 0, 1));
    const ReachabilityScorer scorer(fixture.graph(), coverage);

    const auto a = fixture.view().statements_at_line("demo.C", 31).at(0);
    EXPECT_TRUE(scorer.is_statement_covered(a));

    // "n" has no position and always counts as uncovered.
    const auto outcome = scorer.evaluate(line("demo.C", 30, 1, 2));
    EXPECT_EQ(outcome.reached, 3U);
    EXPECT_EQ(outcome.score, 2U);

    const std::vector<StmtRef> seeds{a};
    const auto reached = scorer.reachable_from(seeds);
    ASSERT_EQ(reached.size(), 3U);
    EXPECT_TRUE(std::ranges::is_sorted(reached));
}

TEST(ReachabilityScorerTest, VisitedBudgetTruncates)
{
    const Fixture fixture(stuckrank::test::caller_callee_module(), "demo.A.fuzz");
    const auto coverage = stuckrank::test::caller_callee_coverage();

    for (const bool memoize : {true, false}) {
        const ReachabilityScorer scorer(
            fixture.graph(), coverage,
            ScorerConfig{.memoize_callees = memoize,
                         .budget = ScoreBudget{.max_visited_statements = 3, .max_time_ms = std::nullopt}});
        const auto outcome = scorer.evaluate(line("demo.A", 10, 1, 3, 1, 2));
        EXPECT_TRUE(outcome.truncated);
        EXPECT_EQ(outcome.limit, BudgetLimit::kVisitedStatements);
        EXPECT_EQ(outcome.reached, 3U);
        EXPECT_LE(outcome.score, 3U);
    }

    const ReachabilityScorer roomy(
        fixture.graph(), coverage,
        ScorerConfig{.memoize_callees = true,
                     .budget = ScoreBudget{.max_visited_statements = 100, .max_time_ms = 60000}});
    const auto outcome = roomy.evaluate(line("demo.A", 10, 1, 3, 1, 2));
    EXPECT_FALSE(outcome.truncated);
    EXPECT_EQ(outcome.score, 8U);
    EXPECT_FALSE(roomy.config().budget.unlimited());
    EXPECT_TRUE(ScoreBudget{}.unlimited());
    EXPECT_EQ(to_string(BudgetLimit::kVisitedStatements), "max_visited_statements");
    EXPECT_EQ(to_string(BudgetLimit::kTime), "max_time_ms");
    EXPECT_EQ(to_string(BudgetLimit::kNone), "none");
}

TEST(ReachabilityScorerTest, TimeBudgetTruncates)
{
    // Long enough that the clock is consulted during the traversal.
    constexpr int kChainLength = 600;
    std::vector<program::StmtRecord> chain;
    for (int i = 0; i < kChainLength; ++i) {
        std::vector<std::string> succs;
        if (i + 1 < kChainLength) {
            succs.push_back("c" + std::to_string(i + 1));
        }
        chain.push_back(stmt("c" + std::to_string(i), 10 + i, std::move(succs)));
    }
    const Fixture fixture(module("chain", {klass("demo.Chain", {method("fuzz", std::move(chain), "void", {"byte[]"})})}),
                          "demo.Chain.fuzz");
    const coverage::CoverageTable coverage;

    for (const bool memoize : {true, false}) {
        const ReachabilityScorer scorer(
            fixture.graph(), coverage,
            ScorerConfig{.memoize_callees = memoize,
                         .budget = ScoreBudget{.max_visited_statements = std::nullopt, .max_time_ms = 0}});
        const auto outcome = scorer.evaluate(line("demo.Chain", 10, 1, 3, 1, 2));
        EXPECT_TRUE(outcome.truncated);
        EXPECT_EQ(outcome.limit, BudgetLimit::kTime);
        EXPECT_LT(outcome.reached, static_cast<std::size_t>(kChainLength));
        EXPECT_EQ(outcome.score, outcome.reached);
    }

    const ReachabilityScorer unbounded(fixture.graph(), coverage);
    const auto outcome = unbounded.evaluate(line("demo.Chain", 10, 1, 3, 1, 2));
    EXPECT_FALSE(outcome.truncated);
    EXPECT_EQ(outcome.score, static_cast<std::uint64_t>(kChainLength));
}

TEST(ReachabilityScorerTest, ConcurrentScoringAgrees)
{
    const Fixture fixture(shared_callee_module(), "demo.Main.fuzz");
    const auto coverage = shared_callee_coverage();
    const ReachabilityScorer scorer(fixture.graph(), coverage);
    const auto points = coverage::select_stuck_points(coverage);

    std::vector<std::uint64_t> expected;
    {
        const ReachabilityScorer reference(fixture.graph(), coverage, ScorerConfig{.memoize_callees = false});
        for (const auto& point : points) {
            expected.push_back(reference.score(point));
        }
    }

    constexpr int kThreads = 8;
    std::vector<std::vector<std::uint64_t>> results(kThreads);
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&, t] {
                for (int round = 0; round < 50; ++round) {
                    for (const auto& point : points) {
                        results[static_cast<std::size_t>(t)].push_back(scorer.score(point));
                    }
                }
            });
        }
    }
    for (const auto& per_thread : results) {
        ASSERT_EQ(per_thread.size(), points.size() * 50U);
        for (std::size_t i = 0; i < per_thread.size(); ++i) {
            EXPECT_EQ(per_thread[i], expected[i % points.size()]);
        }
    }
}

}  // namespace stuckrank::scorer::test
