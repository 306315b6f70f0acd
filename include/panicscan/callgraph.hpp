#pragma once

/**
 * @file callgraph.hpp
 * @brief Call graph data model: procedures, invocations and address indices
 */

#include "panicscan/instruction.hpp"
#include "panicscan/stable_graph.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace panicscan::callgraph {

struct Crate
{
    std::string name;
    std::optional<std::string> version;

    bool operator==(const Crate&) const = default;
};

struct Location
{
    std::string file;
    std::uint32_t line = 0;

    bool operator==(const Location&) const = default;
};

/// Flags written by analysis passes after construction.
struct ProcedureAttributes
{
    bool entry_point = false;
    bool reachable_from_entry_point = false;
    bool is_panic = false;
    bool is_panic_origin = false;
    bool whitelisted = false;
};

struct Procedure
{
    Address start_address = 0;
    Address end_address = 0;  ///< one past the last byte
    std::string name;
    std::string linkage_name;
    std::string linkage_name_demangled;
    Crate defining_crate;
    std::optional<Location> location;
    std::vector<Instruction> disassembly;
    ProcedureAttributes attributes{};
    bool is_placeholder = false;  ///< callee without a definition in the binary
    nlohmann::json metadata;      ///< owned by downstream passes

    [[nodiscard]] bool contains(Address address) const noexcept
    {
        return address >= start_address && address < end_address;
    }

    /// Demangled linkage name when present, plain name otherwise.
    [[nodiscard]] const std::string& display_name() const noexcept
    {
        return linkage_name_demangled.empty() ? name : linkage_name_demangled;
    }
};

enum class InvocationType {
    kDirect,
    kProcedureReference,
    kVTable,
    kJump
};

[[nodiscard]] std::string_view to_string(InvocationType type) noexcept;

struct InlinedFrame
{
    std::string function_name;
    Location location;
    Crate defining_crate;
};

struct InvocationAttributes
{
    bool whitelisted = false;
};

struct Invocation
{
    InvocationType invocation_type = InvocationType::kDirect;
    Address call_site = 0;
    InvocationAttributes attributes{};
    std::vector<InlinedFrame> frames;  ///< outermost first
    /// String literal passed to `core::panicking::panic` at this site
    std::optional<std::string> message_argument;
    nlohmann::json metadata;
};

/// Indirect call site that no finder could bind to a target.
struct UnresolvedInvocation
{
    Address call_site = 0;
    NodeIndex enclosing;
    std::string reason;
};

struct CompilationInfo
{
    std::vector<std::string> compilation_dirs;
    std::string toolchain_version;  ///< empty when not detected
};

/**
 * @brief Procedures and invocations of one binary, keyed by address
 *
 * Structure (nodes, edges, indices) is only changed by the builder and its
 * invocation finders. Later passes address nodes and edges by index and use
 * the update_* operations.
 */
class CallGraph
{
public:
    using Graph = StableGraph<Procedure, Invocation>;

    CallGraph() = default;

    // ------------------------------------------------------------------
    // Structural edits (builder / finder phase)
    // ------------------------------------------------------------------

    /// Adds a defined procedure. Returns nullopt if its start address is already indexed.
    std::optional<NodeIndex> add_procedure(Procedure procedure);

    /// Records that the call/jump instruction at `address` belongs to `enclosing`.
    void index_call_site(Address address, NodeIndex enclosing);

    /**
     * Adds an invocation edge from `source` to `target`.
     * Returns nullopt, leaving the graph unchanged, if the invocation's call
     * site already owns an outgoing edge.
     */
    std::optional<EdgeIndex> add_invocation(NodeIndex source, NodeIndex target, Invocation invocation);

    /**
     * Adds an invocation to `target_address`: the defined procedure starting
     * there, else a placeholder named `placeholder_name` (created on first use).
     * The call-site claim is checked before any placeholder is created.
     */
    std::optional<EdgeIndex> add_invocation_to_address(NodeIndex source,
                                                       Address target_address,
                                                       std::string_view placeholder_name,
                                                       Invocation invocation);

    void record_unresolved(UnresolvedInvocation unresolved);

    void set_compilation_info(CompilationInfo info) { m_compilation_info = std::move(info); }

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] const Graph& graph() const noexcept { return m_graph; }

    [[nodiscard]] const Procedure& procedure(NodeIndex idx) const { return m_graph[idx]; }
    [[nodiscard]] const Invocation& invocation(EdgeIndex idx) const { return m_graph[idx]; }

    [[nodiscard]] const std::unordered_map<Address, NodeIndex>& proc_index() const noexcept
    {
        return m_proc_index;
    }

    [[nodiscard]] const std::unordered_map<Address, NodeIndex>& call_index() const noexcept
    {
        return m_call_index;
    }

    [[nodiscard]] std::optional<NodeIndex> find_procedure(Address start_address) const;

    [[nodiscard]] std::optional<NodeIndex> enclosing_procedure(Address call_site) const;

    /// Defined procedure whose [start, end) range contains `address`.
    [[nodiscard]] std::optional<NodeIndex> procedure_containing(Address address) const;

    [[nodiscard]] std::optional<NodeIndex> find_placeholder(Address target_address) const;

    [[nodiscard]] bool is_call_site_resolved(Address call_site) const;

    [[nodiscard]] const std::vector<UnresolvedInvocation>& unresolved_invocations() const noexcept
    {
        return m_unresolved;
    }

    [[nodiscard]] const CompilationInfo& compilation_info() const noexcept
    {
        return m_compilation_info;
    }

    // ------------------------------------------------------------------
    // Attribute updates (analysis phase)
    // ------------------------------------------------------------------

    void update_procedure_attributes(NodeIndex idx,
                                     const std::function<void(ProcedureAttributes&)>& update);

    void update_invocation_attributes(EdgeIndex idx,
                                      const std::function<void(InvocationAttributes&)>& update);

    [[nodiscard]] nlohmann::json& procedure_metadata(NodeIndex idx) { return m_graph[idx].metadata; }
    [[nodiscard]] nlohmann::json& invocation_metadata(EdgeIndex idx) { return m_graph[idx].metadata; }

private:
    Graph m_graph;
    std::unordered_map<Address, NodeIndex> m_proc_index;
    std::unordered_map<Address, NodeIndex> m_call_index;
    std::unordered_map<Address, NodeIndex> m_placeholder_index;
    std::map<Address, NodeIndex> m_ranges;
    std::unordered_set<Address> m_resolved_call_sites;
    std::vector<UnresolvedInvocation> m_unresolved;
    CompilationInfo m_compilation_info;
};

}  // namespace panicscan::callgraph
