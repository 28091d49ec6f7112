/**
 * @file correspondence.cpp
 * @brief Partial injective mapping between two call graphs
 */

#include "graphmat/correspondence.hpp"

namespace graphmat::match {

bool Correspondence::confirm(VertexId a, VertexId b, double score)
{
    if (m_forward.contains(a) || m_reverse.contains(b)) {
        return false;
    }
    m_forward.emplace(a, Entry{.b = b, .score = score});
    m_reverse.emplace(b, a);
    return true;
}

std::optional<VertexId> Correspondence::partner_of_a(VertexId a) const
{
    auto it = m_forward.find(a);
    if (it == m_forward.end()) {
        return std::nullopt;
    }
    return it->second.b;
}

std::optional<VertexId> Correspondence::partner_of_b(VertexId b) const
{
    auto it = m_reverse.find(b);
    if (it == m_reverse.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> Correspondence::score_of(VertexId a) const
{
    auto it = m_forward.find(a);
    if (it == m_forward.end()) {
        return std::nullopt;
    }
    return it->second.score;
}

}  // namespace graphmat::match
