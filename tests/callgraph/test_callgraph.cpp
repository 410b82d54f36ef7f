#include "stuckrank/callgraph.hpp"

#include "program_fixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace stuckrank::callgraph::test {

namespace {

using program::CallKind;
using program::ProgramView;
using stuckrank::test::abstract_method;
using stuckrank::test::call_stmt;
using stuckrank::test::interface_class;
using stuckrank::test::klass;
using stuckrank::test::method;
using stuckrank::test::module;
using stuckrank::test::sig;
using stuckrank::test::stmt;

/**
 *   interface Shape { double area(); }
 *   abstract class Base implements Shape { abstract double area(); void describe() {...} }
 *   class Circle extends Base { double area() {...} }
 *   class Square extends Base { double area() {...} }
 *   class Blob extends Base {}                        (no concrete area)
 *   interface Greeter { default void greet() {...} }
 *   class Impl implements Greeter {}
 *   class Main { void fuzz(byte[]) {...}  void unused() {...} }
 */
program::ProgramModule shapes_module()
{
    auto base = klass("demo.Base",
                      {abstract_method("area", "double"), method("describe", {stmt("d0", 40)})},
                      std::nullopt, {"demo.Shape"});
    base.is_abstract = true;
    auto blob = klass("demo.Blob", {}, "demo.Base");

    return module(
        "shapes",
        {interface_class("demo.Shape", {abstract_method("area", "double")}),
         base,
         klass("demo.Circle", {method("area", {stmt("c0", 50)}, "double")}, "demo.Base"),
         klass("demo.Square", {method("area", {stmt("q0", 60)}, "double")}, "demo.Base"),
         blob,
         interface_class("demo.Greeter", {method("greet", {stmt("g0", 70)})}),
         klass("demo.Impl", {}, std::nullopt, {"demo.Greeter"}),
         klass("demo.Main",
               {method("fuzz",
                       {call_stmt("s0", 10, CallKind::kInterface, sig("demo.Shape", "area", "double"), {"s1"}),
                        call_stmt("s1", 11, CallKind::kInterface, sig("demo.Greeter", "greet"), {"s2"}),
                        call_stmt("s2", 12, CallKind::kDynamic, sig("demo.Main", "lambda$0"), {"s3"}),
                        call_stmt("s3", 13, CallKind::kStatic, sig("lib.Missing", "foo"), {"s4"}),
                        call_stmt("s4", 14, CallKind::kSpecial, sig("demo.Base", "describe"))},
                       "void",
                       {"byte[]"}),
                method("unused",
                       {call_stmt("u0", 30, CallKind::kVirtual, sig("demo.Circle", "area", "double"))})})});
}

MethodRef method_ref(const ProgramView& view, const std::string& klass_name, const std::string& sub_signature)
{
    return view.find_declared_method(view.find_class(klass_name).value(), sub_signature).value();
}

StmtRef statement_at(const ProgramView& view, const std::string& klass_name, std::int32_t line)
{
    return view.statements_at_line(klass_name, line).at(0);
}

std::vector<program::MethodQuery> queries(std::initializer_list<const char*> texts)
{
    std::vector<program::MethodQuery> result;
    for (const auto* text : texts) {
        result.push_back(program::parse_method_query(text).value());
    }
    return result;
}

}  // namespace

// ============================================================================
// ClassHierarchy
// ============================================================================

TEST(ClassHierarchyTest, SubtypeClosureCoversTransitiveImplementors)
{
    const std::vector<program::ProgramModule> modules{shapes_module()};
    const auto view = ProgramView::build(modules);
    const ClassHierarchy hierarchy(view);

    const auto shape = view.find_class("demo.Shape").value();
    const auto base = view.find_class("demo.Base").value();
    std::vector<ClassRef> expected{shape,
                                   base,
                                   view.find_class("demo.Circle").value(),
                                   view.find_class("demo.Square").value(),
                                   view.find_class("demo.Blob").value()};
    std::ranges::sort(expected);
    EXPECT_EQ(hierarchy.subtype_closure(shape), expected);
    EXPECT_EQ(hierarchy.superclass_of(view.find_class("demo.Circle").value()), base);
    EXPECT_FALSE(hierarchy.superclass_of(base).has_value());
    ASSERT_EQ(hierarchy.interfaces_of(base).size(), 1U);
    EXPECT_EQ(hierarchy.interfaces_of(base).front(), shape);
}

TEST(ClassHierarchyTest, VirtualResolutionSkipsAbstractTargets)
{
    const std::vector<program::ProgramModule> modules{shapes_module()};
    const auto view = ProgramView::build(modules);
    const ClassHierarchy hierarchy(view);

    std::vector<MethodRef> expected{method_ref(view, "demo.Circle", "double area()"),
                                    method_ref(view, "demo.Square", "double area()")};
    std::ranges::sort(expected);
    EXPECT_EQ(hierarchy.resolve_virtual(view.find_class("demo.Shape").value(), "double area()"), expected);

    // Blob inherits only the abstract declaration.
    EXPECT_FALSE(hierarchy.dispatch(view.find_class("demo.Blob").value(), "double area()").has_value());

    const auto circle_only = hierarchy.resolve_virtual(view.find_class("demo.Circle").value(), "double area()");
    ASSERT_EQ(circle_only.size(), 1U);
    EXPECT_EQ(circle_only.front(), method_ref(view, "demo.Circle", "double area()"));
}

TEST(ClassHierarchyTest, DispatchFallsBackToDefaultMethods)
{
    const std::vector<program::ProgramModule> modules{shapes_module()};
    const auto view = ProgramView::build(modules);
    const ClassHierarchy hierarchy(view);

    const auto target = hierarchy.dispatch(view.find_class("demo.Impl").value(), "void greet()");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, method_ref(view, "demo.Greeter", "void greet()"));
}

TEST(ClassHierarchyTest, VirtualResolutionKeepsImplementationsWithoutConcreteReceiver)
{
    auto base = klass("demo.Base", {method("foo", {stmt("f0", 20)})});
    base.is_abstract = true;
    auto middle = klass("demo.Middle", {method("bar", {stmt("m0", 30)})}, "demo.Root");
    middle.is_abstract = true;
    auto root = klass("demo.Root", {abstract_method("bar")});
    root.is_abstract = true;
    const std::vector<program::ProgramModule> modules{
        module("lonely",
               {base,
                interface_class("demo.Walker", {method("walk", {stmt("w0", 40)})}),
                root,
                middle,
                klass("demo.Leaf", {method("bar", {stmt("l0", 50)})}, "demo.Middle")})};
    const auto view = ProgramView::build(modules);
    const ClassHierarchy hierarchy(view);

    const auto foo = hierarchy.resolve_virtual(view.find_class("demo.Base").value(), "void foo()");
    ASSERT_EQ(foo.size(), 1U);
    EXPECT_EQ(foo.front(), method_ref(view, "demo.Base", "void foo()"));

    const auto walk = hierarchy.resolve_virtual(view.find_class("demo.Walker").value(), "void walk()");
    ASSERT_EQ(walk.size(), 1U);
    EXPECT_EQ(walk.front(), method_ref(view, "demo.Walker", "void walk()"));

    // Leaf overrides Middle.bar, yet Middle.bar stays a candidate.
    std::vector<MethodRef> bar_expected{method_ref(view, "demo.Middle", "void bar()"),
                                        method_ref(view, "demo.Leaf", "void bar()")};
    std::ranges::sort(bar_expected);
    EXPECT_EQ(hierarchy.resolve_virtual(view.find_class("demo.Root").value(), "void bar()"), bar_expected);
}

// ============================================================================
// CallGraph
// ============================================================================

TEST(CallGraphTest, VirtualCallOnAbstractTypeReachesItsBody)
{
    auto base = klass("demo.Base", {method("foo", {stmt("f0", 20, {"f1"}), stmt("f1", 21, {"f2"}), stmt("f2", 22)})});
    base.is_abstract = true;
    const std::vector<program::ProgramModule> modules{module(
        "abstract_receiver",
        {base,
         klass("demo.Main",
               {method("fuzz",
                       {call_stmt("s0", 10, CallKind::kVirtual, sig("demo.Base", "foo"))},
                       "void",
                       {"byte[]"})})})};
    const auto view = ProgramView::build(modules);
    const auto entries = queries({"demo.Main.fuzz"});

    auto graph = build_call_graph(view, entries);
    ASSERT_TRUE(graph.has_value()) << graph.error().message;
    const auto& callees = graph->callees_of(statement_at(view, "demo.Main", 10));
    ASSERT_EQ(callees.size(), 1U);
    EXPECT_EQ(callees.front(), method_ref(view, "demo.Base", "void foo()"));
    EXPECT_EQ(graph->stats().unresolved_call_sites, 0U);
    EXPECT_EQ(graph->stats().edges, 1U);
}

TEST(CallGraphTest, ResolvesCallSitesFromEntryPoints)
{
    const std::vector<program::ProgramModule> modules{shapes_module()};
    const auto view = ProgramView::build(modules);
    const auto entries = queries({"demo.Main.fuzz"});

    auto graph = build_call_graph(view, entries);
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const auto fuzz = method_ref(view, "demo.Main", "void fuzz(byte[])");
    ASSERT_EQ(graph->entry_methods().size(), 1U);
    EXPECT_EQ(graph->entry_methods().front(), fuzz);
    EXPECT_EQ(graph->reachable_methods().front(), fuzz);

    EXPECT_EQ(graph->callees_of(statement_at(view, "demo.Main", 10)).size(), 2U);
    ASSERT_EQ(graph->callees_of(statement_at(view, "demo.Main", 11)).size(), 1U);
    EXPECT_EQ(graph->callees_of(statement_at(view, "demo.Main", 11)).front(),
              method_ref(view, "demo.Greeter", "void greet()"));
    EXPECT_TRUE(graph->callees_of(statement_at(view, "demo.Main", 12)).empty());
    EXPECT_TRUE(graph->callees_of(statement_at(view, "demo.Main", 13)).empty());
    ASSERT_EQ(graph->callees_of(statement_at(view, "demo.Main", 14)).size(), 1U);
    EXPECT_EQ(graph->callees_of(statement_at(view, "demo.Main", 14)).front(),
              method_ref(view, "demo.Base", "void describe()"));

    EXPECT_TRUE(graph->is_reachable(method_ref(view, "demo.Circle", "double area()")));
    EXPECT_FALSE(graph->is_reachable(method_ref(view, "demo.Main", "void unused()")));
    // Methods outside the reachable set contribute no edges.
    EXPECT_TRUE(graph->callees_of(statement_at(view, "demo.Main", 30)).empty());

    const auto& stats = graph->stats();
    EXPECT_EQ(stats.entry_methods, 1U);
    EXPECT_EQ(stats.reachable_methods, 5U);
    EXPECT_EQ(stats.edges, 4U);
    EXPECT_EQ(stats.call_sites, 5U);
    EXPECT_EQ(stats.unresolved_call_sites, 1U);
    EXPECT_EQ(stats.dynamic_call_sites, 1U);
}

TEST(CallGraphTest, RecursionTerminates)
{
    const std::vector<program::ProgramModule> modules{module(
        "recursion",
        {klass("demo.Even",
               {method("test",
                       {call_stmt("e0", 5, CallKind::kStatic, sig("demo.Odd", "test", "boolean", {"int"}))},
                       "boolean",
                       {"int"})}),
         klass("demo.Odd",
               {method("test",
                       {call_stmt("o0", 9, CallKind::kStatic, sig("demo.Even", "test", "boolean", {"int"}))},
                       "boolean",
                       {"int"})})})};
    const auto view = ProgramView::build(modules);
    const auto entries = queries({"demo.Even.test"});

    auto graph = build_call_graph(view, entries);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->stats().reachable_methods, 2U);
    EXPECT_EQ(graph->stats().edges, 2U);
}

TEST(CallGraphTest, DuplicateEntryPointsCollapse)
{
    const std::vector<program::ProgramModule> modules{stuckrank::test::caller_callee_module()};
    const auto view = ProgramView::build(modules);
    const auto entries = queries({"demo.A.fuzz", "<demo.A: void fuzz(byte[])>", "demo.B.work"});

    auto graph = build_call_graph(view, entries);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->entry_methods().size(), 2U);
    EXPECT_EQ(graph->stats().reachable_methods, 2U);
}

TEST(CallGraphTest, EntryPointErrorsAreFatal)
{
    const std::vector<program::ProgramModule> modules{stuckrank::test::caller_callee_module()};
    const auto view = ProgramView::build(modules);

    auto none = build_call_graph(view, {});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, "InvalidEntryPoint");

    const auto missing = queries({"demo.A.fuzz", "demo.A.nothing"});
    auto not_found = build_call_graph(view, missing);
    ASSERT_FALSE(not_found.has_value());
    EXPECT_EQ(not_found.error().code, "EntryPointNotFound");

    const auto resolved = resolve_entry_points(view, queries({"demo.B.work"}));
    ASSERT_TRUE(resolved.has_value());
    ASSERT_EQ(resolved->size(), 1U);
    EXPECT_EQ(view.method(resolved->front()).signature.declaring_class, "demo.B");
}

}  // namespace stuckrank::callgraph::test
