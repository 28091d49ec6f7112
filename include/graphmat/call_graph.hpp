#pragma once

/**
 * @file call_graph.hpp
 * @brief Immutable call graph with per-function opcode sequences
 */

#include "graphmat/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace graphmat::graph {

/**
 * @brief A function: its opcodes and its immediate call neighbourhood
 *
 * Vertices live in a CallGraph arena and are only built by CallGraphBuilder.
 */
class Vertex
{
public:
    [[nodiscard]] VertexId id() const noexcept { return m_id; }

    /// One mnemonic per instruction, in address order.
    [[nodiscard]] const std::vector<std::string>& opcodes() const noexcept { return m_opcodes; }

    /// Callee of every call site in call order (duplicates preserved).
    [[nodiscard]] const std::vector<VertexId>& call_sites() const noexcept { return m_call_sites; }

    /// Distinct callees in order of first call.
    [[nodiscard]] const std::vector<VertexId>& callees() const noexcept { return m_callees; }

    /// Distinct callers in ascending id order.
    [[nodiscard]] const std::vector<VertexId>& callers() const noexcept { return m_callers; }

    /// The function calls itself.
    [[nodiscard]] bool is_recursive() const noexcept { return m_recursive; }

    /// No code was extracted (import, thunk or unresolved target).
    [[nodiscard]] bool is_external() const noexcept { return m_opcodes.empty(); }

    [[nodiscard]] bool calls(VertexId callee) const noexcept;

private:
    friend class CallGraphBuilder;

    VertexId m_id = 0;
    std::vector<std::string> m_opcodes;
    std::vector<VertexId> m_call_sites;
    std::vector<VertexId> m_callees;
    std::vector<VertexId> m_callers;
    bool m_recursive = false;
};

/**
 * @brief Read-only call graph
 *
 * Vertices are stored contiguously in ascending id order and looked up by
 * binary search, so cycles never turn into reference cycles.
 */
class CallGraph
{
public:
    CallGraph() = default;

    [[nodiscard]] std::size_t size() const noexcept { return m_vertices.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_vertices.empty(); }

    /// Number of distinct (caller, callee) edges.
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edge_count; }

    /// Vertices in ascending id order.
    [[nodiscard]] std::span<const Vertex> vertices() const noexcept { return m_vertices; }

    [[nodiscard]] bool contains(VertexId id) const noexcept { return find(id) != nullptr; }

    /**
     * @brief Look up a vertex
     * @return The vertex, or nullptr when the id is not part of the graph
     */
    [[nodiscard]] const Vertex* find(VertexId id) const noexcept;

    [[nodiscard]] bool has_edge(VertexId caller, VertexId callee) const noexcept;

    /// Program entry point, when the extractor recorded one.
    [[nodiscard]] std::optional<VertexId> entry() const noexcept { return m_entry; }

    /// Address of the text section; added to ids when printing addresses.
    [[nodiscard]] std::uint64_t base_address() const noexcept { return m_base_address; }

private:
    friend class CallGraphBuilder;

    std::vector<Vertex> m_vertices;
    std::size_t m_edge_count = 0;
    std::optional<VertexId> m_entry;
    std::uint64_t m_base_address = 0;
};

/**
 * @brief Collects functions and calls, then freezes them into a CallGraph
 */
class CallGraphBuilder
{
public:
    CallGraphBuilder& add_function(VertexId id, std::vector<std::string> opcodes = {});
    CallGraphBuilder& add_call(VertexId caller, VertexId callee);
    CallGraphBuilder& set_entry(VertexId entry);
    CallGraphBuilder& set_base_address(std::uint64_t base_address);

    /**
     * @brief Build the graph
     *
     * Fails with InvalidGraph when a function is declared twice, when a call
     * names an undeclared function, or when the entry is undeclared.
     */
    [[nodiscard]] graphmat::Result<CallGraph> build() &&;

private:
    struct PendingFunction
    {
        VertexId id;
        std::vector<std::string> opcodes;
    };

    std::vector<PendingFunction> m_functions;
    std::vector<VertexPair> m_calls;
    std::optional<VertexId> m_entry;
    std::uint64_t m_base_address = 0;
};

}  // namespace graphmat::graph
