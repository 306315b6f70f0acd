#pragma once

/**
 * @file stable_graph.hpp
 * @brief Directed multigraph with stable node and edge indices
 *
 * Nodes and edges are only ever appended, so an index handed out once stays
 * valid for the lifetime of the graph. Storage is a std::deque, so references
 * to node and edge weights also survive later insertions.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <ranges>
#include <span>
#include <vector>

namespace panicscan::callgraph {

struct NodeIndex
{
    std::uint32_t value = 0;

    auto operator<=>(const NodeIndex&) const = default;
};

struct EdgeIndex
{
    std::uint32_t value = 0;

    auto operator<=>(const EdgeIndex&) const = default;
};

template <typename N, typename E>
class StableGraph
{
public:
    struct Node
    {
        N weight;
        std::vector<EdgeIndex> outgoing;
        std::vector<EdgeIndex> incoming;
    };

    struct Edge
    {
        E weight;
        NodeIndex source;
        NodeIndex target;
    };

    NodeIndex add_node(N weight)
    {
        const NodeIndex idx{static_cast<std::uint32_t>(m_nodes.size())};
        m_nodes.push_back(Node{.weight = std::move(weight), .outgoing = {}, .incoming = {}});
        return idx;
    }

    EdgeIndex add_edge(NodeIndex source, NodeIndex target, E weight)
    {
        const EdgeIndex idx{static_cast<std::uint32_t>(m_edges.size())};
        m_edges.push_back(Edge{.weight = std::move(weight), .source = source, .target = target});
        m_nodes.at(source.value).outgoing.push_back(idx);
        m_nodes.at(target.value).incoming.push_back(idx);
        return idx;
    }

    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edges.size(); }

    [[nodiscard]] bool contains(NodeIndex idx) const noexcept { return idx.value < m_nodes.size(); }
    [[nodiscard]] bool contains(EdgeIndex idx) const noexcept { return idx.value < m_edges.size(); }

    [[nodiscard]] N& operator[](NodeIndex idx) { return m_nodes.at(idx.value).weight; }
    [[nodiscard]] const N& operator[](NodeIndex idx) const { return m_nodes.at(idx.value).weight; }
    [[nodiscard]] E& operator[](EdgeIndex idx) { return m_edges.at(idx.value).weight; }
    [[nodiscard]] const E& operator[](EdgeIndex idx) const { return m_edges.at(idx.value).weight; }

    [[nodiscard]] NodeIndex edge_source(EdgeIndex idx) const { return m_edges.at(idx.value).source; }
    [[nodiscard]] NodeIndex edge_target(EdgeIndex idx) const { return m_edges.at(idx.value).target; }

    [[nodiscard]] std::span<const EdgeIndex> outgoing_edges(NodeIndex idx) const
    {
        return m_nodes.at(idx.value).outgoing;
    }

    [[nodiscard]] std::span<const EdgeIndex> incoming_edges(NodeIndex idx) const
    {
        return m_nodes.at(idx.value).incoming;
    }

    /// Successor nodes in edge insertion order; a node appears once per edge.
    [[nodiscard]] std::vector<NodeIndex> successors(NodeIndex idx) const
    {
        std::vector<NodeIndex> result;
        for (const EdgeIndex edge : outgoing_edges(idx)) {
            result.push_back(edge_target(edge));
        }
        return result;
    }

    [[nodiscard]] std::vector<NodeIndex> predecessors(NodeIndex idx) const
    {
        std::vector<NodeIndex> result;
        for (const EdgeIndex edge : incoming_edges(idx)) {
            result.push_back(edge_source(edge));
        }
        return result;
    }

    [[nodiscard]] auto node_indices() const
    {
        return std::views::iota(std::uint32_t{0}, static_cast<std::uint32_t>(m_nodes.size()))
               | std::views::transform([](std::uint32_t i) { return NodeIndex{i}; });
    }

    [[nodiscard]] auto edge_indices() const
    {
        return std::views::iota(std::uint32_t{0}, static_cast<std::uint32_t>(m_edges.size()))
               | std::views::transform([](std::uint32_t i) { return EdgeIndex{i}; });
    }

private:
    std::deque<Node> m_nodes;
    std::deque<Edge> m_edges;
};

}  // namespace panicscan::callgraph

template <>
struct std::hash<panicscan::callgraph::NodeIndex>
{
    std::size_t operator()(const panicscan::callgraph::NodeIndex& idx) const noexcept
    {
        return std::hash<std::uint32_t>{}(idx.value);
    }
};

template <>
struct std::hash<panicscan::callgraph::EdgeIndex>
{
    std::size_t operator()(const panicscan::callgraph::EdgeIndex& idx) const noexcept
    {
        return std::hash<std::uint32_t>{}(idx.value);
    }
};
