/**
 * @file call_graph.cpp
 * @brief CallGraph structural edits, index lookups and attribute updates
 */

#include "panicscan/callgraph.hpp"

#include <algorithm>
#include <utility>

namespace panicscan::callgraph {

std::string_view to_string(InvocationType type) noexcept
{
    switch (type) {
        case InvocationType::kDirect:
            return "direct";
        case InvocationType::kProcedureReference:
            return "procedure";
        case InvocationType::kVTable:
            return "vtable";
        case InvocationType::kJump:
            return "jump";
    }
    return "unknown";
}

std::optional<NodeIndex> CallGraph::add_procedure(Procedure procedure)
{
    const Address start = procedure.start_address;
    if (m_proc_index.contains(start)) {
        return std::nullopt;
    }
    procedure.is_placeholder = false;
    const NodeIndex idx = m_graph.add_node(std::move(procedure));
    m_proc_index.emplace(start, idx);
    m_ranges.emplace(start, idx);
    return idx;
}

void CallGraph::index_call_site(Address address, NodeIndex enclosing)
{
    m_call_index.insert_or_assign(address, enclosing);
}

std::optional<EdgeIndex>
CallGraph::add_invocation(NodeIndex source, NodeIndex target, Invocation invocation)
{
    if (!m_graph.contains(source) || !m_graph.contains(target)) {
        return std::nullopt;
    }
    const Address call_site = invocation.call_site;
    if (!m_resolved_call_sites.insert(call_site).second) {
        return std::nullopt;
    }
    std::erase_if(m_unresolved, [call_site](const UnresolvedInvocation& unresolved) {
        return unresolved.call_site == call_site;
    });
    return m_graph.add_edge(source, target, std::move(invocation));
}

std::optional<EdgeIndex> CallGraph::add_invocation_to_address(NodeIndex source,
                                                              Address target_address,
                                                              std::string_view placeholder_name,
                                                              Invocation invocation)
{
    if (is_call_site_resolved(invocation.call_site)) {
        return std::nullopt;
    }
    if (auto defined = find_procedure(target_address)) {
        return add_invocation(source, *defined, std::move(invocation));
    }

    NodeIndex target{};
    if (auto existing = find_placeholder(target_address)) {
        target = *existing;
    } else {
        Procedure placeholder;
        placeholder.start_address = target_address;
        placeholder.end_address = target_address;
        placeholder.name = std::string(placeholder_name);
        placeholder.linkage_name = std::string(placeholder_name);
        placeholder.is_placeholder = true;
        target = m_graph.add_node(std::move(placeholder));
        m_placeholder_index.emplace(target_address, target);
    }
    return add_invocation(source, target, std::move(invocation));
}

void CallGraph::record_unresolved(UnresolvedInvocation unresolved)
{
    if (is_call_site_resolved(unresolved.call_site)) {
        return;
    }
    const bool known = std::ranges::any_of(m_unresolved, [&unresolved](const auto& existing) {
        return existing.call_site == unresolved.call_site;
    });
    if (!known) {
        m_unresolved.push_back(std::move(unresolved));
    }
}

std::optional<NodeIndex> CallGraph::find_procedure(Address start_address) const
{
    if (auto it = m_proc_index.find(start_address); it != m_proc_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<NodeIndex> CallGraph::enclosing_procedure(Address call_site) const
{
    if (auto it = m_call_index.find(call_site); it != m_call_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<NodeIndex> CallGraph::procedure_containing(Address address) const
{
    auto it = m_ranges.upper_bound(address);
    if (it == m_ranges.begin()) {
        return std::nullopt;
    }
    --it;
    if (m_graph[it->second].contains(address)) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<NodeIndex> CallGraph::find_placeholder(Address target_address) const
{
    if (auto it = m_placeholder_index.find(target_address); it != m_placeholder_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool CallGraph::is_call_site_resolved(Address call_site) const
{
    return m_resolved_call_sites.contains(call_site);
}

void CallGraph::update_procedure_attributes(NodeIndex idx,
                                            const std::function<void(ProcedureAttributes&)>& update)
{
    update(m_graph[idx].attributes);
}

void CallGraph::update_invocation_attributes(
    EdgeIndex idx,
    const std::function<void(InvocationAttributes&)>& update)
{
    update(m_graph[idx].attributes);
}

}  // namespace panicscan::callgraph
