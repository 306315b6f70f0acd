/**
 * @file test_builder.cpp
 * @brief Call graph construction over synthetic contexts
 */

#include "panicscan/builder.hpp"

#include "synthetic_context.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <vector>

#include <gtest/gtest.h>

namespace panicscan::callgraph::test {

namespace {

using namespace panicscan::test;

CallGraph build(const SyntheticContext& ctx)
{
    return CallGraphBuilder(default_invocation_finders()).build_call_graph(ctx);
}

std::vector<std::unique_ptr<InvocationFinder>> reversed_finders()
{
    auto finders = default_invocation_finders();
    std::ranges::reverse(finders);
    return finders;
}

}  // namespace

TEST(CallGraphBuilder, DefaultFinderOrder)
{
    CallGraphBuilder builder(default_invocation_finders());
    std::vector<std::string_view> names;
    for (const auto& finder : builder.finders()) {
        names.push_back(finder->name());
    }
    EXPECT_EQ(names, (std::vector<std::string_view>{"direct", "jump", "vtable", "procedure_reference"}));
}

// f calls g directly
TEST(CallGraphBuilder, DirectCallBetweenDefinedProcedures)
{
    SyntheticContext ctx;
    ctx.add_procedure(make_procedure("f", 0x1000, 0x1006, {call_direct(0x1000, 0x2000), ret(0x1005)}));
    ctx.add_procedure(make_procedure("g", 0x2000, 0x2001, {ret(0x2000)}));

    const CallGraph graph = build(ctx);
    ASSERT_EQ(graph.graph().node_count(), 2U);
    ASSERT_EQ(graph.graph().edge_count(), 1U);

    const EdgeIndex edge{0};
    EXPECT_EQ(graph.invocation(edge).invocation_type, InvocationType::kDirect);
    EXPECT_EQ(graph.procedure(graph.graph().edge_source(edge)).name, "f");
    EXPECT_EQ(graph.procedure(graph.graph().edge_target(edge)).name, "g");
    EXPECT_EQ(graph.enclosing_procedure(0x1000), graph.find_procedure(0x1000));
    EXPECT_EQ(graph.compilation_info().toolchain_version, "1.75.0");
}

// h dispatches through a table loaded from an opaque object
TEST(CallGraphBuilder, UnresolvableDispatchIsRecordedNotGuessed)
{
    SyntheticContext ctx;
    ctx.add_procedure(make_procedure("h",
                                     0x1000,
                                     0x1010,
                                     {mov_load(0x1000, "rax", "rdi", 0),
                                      call_memory(0x1004, "rax", 0x18),
                                      ret(0x1007)}));
    ctx.add_procedure(make_procedure("unrelated", 0x2000, 0x2001, {ret(0x2000)}));

    const CallGraph graph = build(ctx);
    EXPECT_EQ(graph.graph().edge_count(), 0U);
    ASSERT_EQ(graph.unresolved_invocations().size(), 1U);
    const auto& unresolved = graph.unresolved_invocations().front();
    EXPECT_EQ(unresolved.call_site, 0x1004U);
    EXPECT_EQ(graph.procedure(unresolved.enclosing).name, "h");
    EXPECT_EQ(unresolved.reason, "dispatch through [rax+0x18]");
}

// p tail-calls q; the conditional jump stays inside p
TEST(CallGraphBuilder, TailCallBecomesJumpEdge)
{
    SyntheticContext ctx;
    ctx.add_procedure(make_procedure("p",
                                     0x1000,
                                     0x1010,
                                     {jcc(0x1000, 0x100b), nop(0x1005), jmp_direct(0x1006, 0x2000), ret(0x100b)}));
    ctx.add_procedure(make_procedure("q", 0x2000, 0x2001, {ret(0x2000)}));

    const CallGraph graph = build(ctx);
    ASSERT_EQ(graph.graph().edge_count(), 1U);
    const EdgeIndex edge{0};
    EXPECT_EQ(graph.invocation(edge).invocation_type, InvocationType::kJump);
    EXPECT_EQ(graph.invocation(edge).call_site, 0x1006U);
    EXPECT_EQ(graph.procedure(graph.graph().edge_target(edge)).name, "q");
    EXPECT_FALSE(graph.is_call_site_resolved(0x1000));
}

// A site both finders can claim is classified by whichever runs first
TEST(CallGraphBuilder, CompetingFindersClaimOnce)
{
    SyntheticContext ctx;
    ctx.add_procedure(make_procedure("f", 0x1000, 0x1006, {call_direct(0x1000, 0x2000), ret(0x1005)}));
    ctx.add_procedure(make_procedure("g", 0x2000, 0x2001, {ret(0x2000)}));
    ctx.mutable_classifier().dual.insert(0x1000);

    const CallGraph canonical = build(ctx);
    const CallGraph reversed = CallGraphBuilder(reversed_finders()).build_call_graph(ctx);

    ASSERT_EQ(canonical.graph().edge_count(), 1U);
    ASSERT_EQ(reversed.graph().edge_count(), 1U);
    EXPECT_EQ(canonical.invocation(EdgeIndex{0}).invocation_type, InvocationType::kDirect);
    EXPECT_EQ(reversed.invocation(EdgeIndex{0}).invocation_type, InvocationType::kJump);
}

TEST(CallGraphBuilder, DuplicateProceduresAcrossUnitsSkipped)
{
    SyntheticContext ctx;
    const auto second = ctx.add_unit("src/lib.rs/@/app.1-cgu.1", "/work/app");
    ctx.add_procedure(make_procedure("f", 0x1000, 0x1006, {call_direct(0x1000, 0x1000), ret(0x1005)}));
    ctx.add_procedure(make_procedure("f_inlined_copy", 0x1000, 0x1006), second);

    const CallGraph graph = build(ctx);
    EXPECT_EQ(graph.graph().node_count(), 1U);
    EXPECT_EQ(graph.procedure(NodeIndex{0}).name, "f");
    EXPECT_EQ(graph.proc_index().size(), 1U);
    // recursion is a self edge
    ASSERT_EQ(graph.graph().edge_count(), 1U);
    EXPECT_EQ(graph.graph().edge_source(EdgeIndex{0}), graph.graph().edge_target(EdgeIndex{0}));
}

TEST(CallGraphBuilder, PlaceholdersOnlyForUndefinedTargets)
{
    SyntheticContext ctx;
    ctx.set_symbol(0x9000, "memcpy");
    ctx.set_pointer(0x5000, 0x9100);
    ctx.set_symbol(0x5000, "free");
    ctx.add_procedure(make_procedure("f",
                                     0x1000,
                                     0x1020,
                                     {call_direct(0x1000, 0x9000),
                                      call_direct(0x1005, 0x9000),
                                      call_rip_slot(0x100a, 0x5000),
                                      call_direct(0x1010, 0x2000),
                                      ret(0x1015)}));
    ctx.add_procedure(make_procedure("g", 0x2000, 0x2001, {ret(0x2000)}));

    const CallGraph graph = build(ctx);
    EXPECT_EQ(graph.graph().node_count(), 4U);
    EXPECT_EQ(graph.graph().edge_count(), 4U);
    ASSERT_TRUE(graph.find_placeholder(0x9000));
    ASSERT_TRUE(graph.find_placeholder(0x9100));
    EXPECT_EQ(graph.procedure(*graph.find_placeholder(0x9000)).name, "memcpy");
    EXPECT_EQ(graph.procedure(*graph.find_placeholder(0x9100)).name, "free");
    EXPECT_FALSE(graph.find_placeholder(0x2000));
}

TEST(CallGraphBuilder, StructuralInvariants)
{
    SyntheticContext ctx;
    ctx.add_procedure(make_procedure("a",
                                     0x1000,
                                     0x1020,
                                     {call_direct(0x1000, 0x2000),
                                      lea_rip(0x1005, "rdi", 0x3000),
                                      call_direct(0x100c, 0x3000),
                                      jmp_direct(0x1011, 0x2000)}));
    ctx.add_procedure(make_procedure("b", 0x2000, 0x2010, {call_direct(0x2000, 0x3000), ret(0x2005)}));
    ctx.add_procedure(make_procedure("c", 0x3000, 0x3001, {ret(0x3000)}));

    const CallGraph graph = build(ctx);

    std::set<Address> call_sites;
    for (const EdgeIndex edge : graph.graph().edge_indices()) {
        const Invocation& invocation = graph.invocation(edge);
        EXPECT_TRUE(call_sites.insert(invocation.call_site).second) << "duplicate edge for call site";
        const Procedure& source = graph.procedure(graph.graph().edge_source(edge));
        EXPECT_TRUE(source.contains(invocation.call_site));
    }
    for (const auto& [address, node] : graph.proc_index()) {
        EXPECT_EQ(graph.procedure(node).start_address, address);
    }
    for (const auto& [address, node] : graph.call_index()) {
        EXPECT_TRUE(graph.procedure(node).contains(address));
    }
    EXPECT_EQ(graph.graph().edge_count(), 5U);
}

}  // namespace panicscan::callgraph::test
