/**
 * @file call_graph.cpp
 * @brief Call graph construction and lookup
 */

#include "graphmat/call_graph.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace graphmat::graph {

bool Vertex::calls(VertexId callee) const noexcept
{
    return std::ranges::find(m_callees, callee) != m_callees.end();
}

const Vertex* CallGraph::find(VertexId id) const noexcept
{
    auto it = std::ranges::lower_bound(m_vertices, id, {}, &Vertex::id);
    if (it == m_vertices.end() || it->id() != id) {
        return nullptr;
    }
    return &*it;
}

bool CallGraph::has_edge(VertexId caller, VertexId callee) const noexcept
{
    const Vertex* vertex = find(caller);
    return vertex != nullptr && vertex->calls(callee);
}

CallGraphBuilder& CallGraphBuilder::add_function(VertexId id, std::vector<std::string> opcodes)
{
    m_functions.push_back(PendingFunction{.id = id, .opcodes = std::move(opcodes)});
    return *this;
}

CallGraphBuilder& CallGraphBuilder::add_call(VertexId caller, VertexId callee)
{
    m_calls.emplace_back(caller, callee);
    return *this;
}

CallGraphBuilder& CallGraphBuilder::set_entry(VertexId entry)
{
    m_entry = entry;
    return *this;
}

CallGraphBuilder& CallGraphBuilder::set_base_address(std::uint64_t base_address)
{
    m_base_address = base_address;
    return *this;
}

graphmat::Result<CallGraph> CallGraphBuilder::build() &&
{
    std::ranges::stable_sort(m_functions, {}, &PendingFunction::id);
    auto duplicate = std::ranges::adjacent_find(m_functions, {}, &PendingFunction::id);
    if (duplicate != m_functions.end()) {
        return std::unexpected(Error::make(
            "InvalidGraph", std::format("Function {:#x} is declared twice", duplicate->id)));
    }

    CallGraph graph;
    graph.m_base_address = m_base_address;
    graph.m_vertices.reserve(m_functions.size());
    for (auto& pending : m_functions) {
        Vertex vertex;
        vertex.m_id = pending.id;
        vertex.m_opcodes = std::move(pending.opcodes);
        graph.m_vertices.push_back(std::move(vertex));
    }

    const auto index_of = [&graph](VertexId id) -> std::optional<std::size_t> {
        auto it = std::ranges::lower_bound(graph.m_vertices, id, {}, &Vertex::id);
        if (it == graph.m_vertices.end() || it->id() != id) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - graph.m_vertices.begin());
    };

    if (m_entry) {
        if (!index_of(*m_entry)) {
            return std::unexpected(Error::make(
                "InvalidGraph", std::format("Entry point {:#x} is not a declared function", *m_entry)));
        }
        graph.m_entry = m_entry;
    }

    for (const auto& [caller, callee] : m_calls) {
        auto caller_index = index_of(caller);
        if (!caller_index) {
            return std::unexpected(Error::make(
                "InvalidGraph", std::format("Call from undeclared function {:#x}", caller)));
        }
        if (!index_of(callee)) {
            return std::unexpected(Error::make(
                "InvalidGraph",
                std::format("Call from {:#x} to undeclared function {:#x}", caller, callee)));
        }
        graph.m_vertices[*caller_index].m_call_sites.push_back(callee);
    }

    // (callee index, caller id) for every distinct edge
    std::vector<std::pair<std::size_t, VertexId>> reverse_edges;
    for (auto& vertex : graph.m_vertices) {
        std::vector<VertexId> seen;
        for (VertexId callee : vertex.m_call_sites) {
            auto pos = std::ranges::lower_bound(seen, callee);
            if (pos != seen.end() && *pos == callee) {
                continue;
            }
            seen.insert(pos, callee);
            vertex.m_callees.push_back(callee);
            reverse_edges.emplace_back(*index_of(callee), vertex.m_id);
            if (callee == vertex.m_id) {
                vertex.m_recursive = true;
            }
        }
        graph.m_edge_count += vertex.m_callees.size();
    }

    std::ranges::sort(reverse_edges);
    for (const auto& [callee_index, caller] : reverse_edges) {
        graph.m_vertices[callee_index].m_callers.push_back(caller);
    }

    return graph;
}

}  // namespace graphmat::graph
