/**
 * @file test_call_graph.cpp
 * @brief CallGraph structural edits, indices and attribute updates
 */

#include "panicscan/callgraph.hpp"

#include "synthetic_context.hpp"

#include <gtest/gtest.h>

using namespace panicscan::callgraph;
using panicscan::test::make_procedure;

namespace {

Invocation invocation_at(Address call_site, InvocationType type = InvocationType::kDirect)
{
    Invocation invocation;
    invocation.invocation_type = type;
    invocation.call_site = call_site;
    return invocation;
}

}  // namespace

TEST(CallGraph, DuplicateStartAddressRejected)
{
    CallGraph graph;
    auto f = graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    auto dup = graph.add_procedure(make_procedure("f_again", 0x1000, 0x1020));

    ASSERT_TRUE(f);
    EXPECT_FALSE(dup);
    EXPECT_EQ(graph.graph().node_count(), 1U);
    EXPECT_EQ(graph.procedure(*f).name, "f");
    EXPECT_EQ(graph.find_procedure(0x1000), f);
}

TEST(CallGraph, OneEdgePerCallSite)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    auto g = *graph.add_procedure(make_procedure("g", 0x2000, 0x2010));
    auto h = *graph.add_procedure(make_procedure("h", 0x3000, 0x3010));

    EXPECT_TRUE(graph.add_invocation(f, g, invocation_at(0x1004)));
    EXPECT_FALSE(graph.add_invocation(f, h, invocation_at(0x1004, InvocationType::kVTable)));
    EXPECT_TRUE(graph.is_call_site_resolved(0x1004));
    EXPECT_EQ(graph.graph().edge_count(), 1U);
}

TEST(CallGraph, PlaceholderCreatedOnceAndOnlyOnSuccess)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));

    auto first = graph.add_invocation_to_address(f, 0x9000, "memcpy", invocation_at(0x1002));
    auto second = graph.add_invocation_to_address(f, 0x9000, "memcpy", invocation_at(0x1008));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(graph.graph().edge_target(*first), graph.graph().edge_target(*second));

    // already-claimed site: no new placeholder
    auto refused = graph.add_invocation_to_address(f, 0xa000, "free", invocation_at(0x1002));
    EXPECT_FALSE(refused);
    EXPECT_FALSE(graph.find_placeholder(0xa000));
    EXPECT_EQ(graph.graph().node_count(), 2U);

    const auto placeholder = *graph.find_placeholder(0x9000);
    EXPECT_TRUE(graph.procedure(placeholder).is_placeholder);
    EXPECT_EQ(graph.procedure(placeholder).name, "memcpy");
    EXPECT_FALSE(graph.find_procedure(0x9000));
}

TEST(CallGraph, InvocationToDefinedTargetUsesExistingNode)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    auto g = *graph.add_procedure(make_procedure("g", 0x2000, 0x2010));

    auto edge = graph.add_invocation_to_address(f, 0x2000, "ignored", invocation_at(0x1004));
    ASSERT_TRUE(edge);
    EXPECT_EQ(graph.graph().edge_target(*edge), g);
    EXPECT_EQ(graph.graph().node_count(), 2U);
}

TEST(CallGraph, ContainmentLookup)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    graph.add_procedure(make_procedure("g", 0x2000, 0x2010));

    EXPECT_EQ(graph.procedure_containing(0x1000), f);
    EXPECT_EQ(graph.procedure_containing(0x100f), f);
    EXPECT_FALSE(graph.procedure_containing(0x1010));
    EXPECT_FALSE(graph.procedure_containing(0x0fff));
}

TEST(CallGraph, UnresolvedClearedWhenResolved)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    auto g = *graph.add_procedure(make_procedure("g", 0x2000, 0x2010));

    graph.record_unresolved({.call_site = 0x1004, .enclosing = f, .reason = "register-indirect call"});
    graph.record_unresolved({.call_site = 0x1004, .enclosing = f, .reason = "again"});
    ASSERT_EQ(graph.unresolved_invocations().size(), 1U);

    graph.add_invocation(f, g, invocation_at(0x1004));
    EXPECT_TRUE(graph.unresolved_invocations().empty());

    graph.record_unresolved({.call_site = 0x1004, .enclosing = f, .reason = "late"});
    EXPECT_TRUE(graph.unresolved_invocations().empty());
}

TEST(CallGraph, AttributeUpdatesByIndex)
{
    CallGraph graph;
    auto f = *graph.add_procedure(make_procedure("f", 0x1000, 0x1010));
    auto g = *graph.add_procedure(make_procedure("g", 0x2000, 0x2010));
    auto edge = *graph.add_invocation(f, g, invocation_at(0x1004));

    graph.update_procedure_attributes(g, [](ProcedureAttributes& attrs) { attrs.is_panic = true; });
    graph.update_invocation_attributes(edge, [](InvocationAttributes& attrs) { attrs.whitelisted = true; });
    graph.procedure_metadata(f)["note"] = "entry";

    EXPECT_TRUE(graph.procedure(g).attributes.is_panic);
    EXPECT_FALSE(graph.procedure(f).attributes.is_panic);
    EXPECT_TRUE(graph.invocation(edge).attributes.whitelisted);
    EXPECT_EQ(graph.procedure(f).metadata["note"], "entry");
}

TEST(CallGraph, InvocationTypeNames)
{
    EXPECT_EQ(to_string(InvocationType::kDirect), "direct");
    EXPECT_EQ(to_string(InvocationType::kProcedureReference), "procedure");
    EXPECT_EQ(to_string(InvocationType::kVTable), "vtable");
    EXPECT_EQ(to_string(InvocationType::kJump), "jump");
}
