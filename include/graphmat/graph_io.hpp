#pragma once

/**
 * @file graph_io.hpp
 * @brief Loading call graphs and seed matchings from JSON documents
 */

#include "graphmat/call_graph.hpp"
#include "graphmat/common.hpp"
#include "graphmat/correspondence.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace graphmat::io {

/**
 * Build a call graph from a call_graph.v1 document.
 * @return Graph, or InvalidGraph for dangling calls and duplicate functions
 */
[[nodiscard]] graphmat::Result<graph::CallGraph> call_graph_from_json(const nlohmann::json& j);

/**
 * Read, schema-validate and build a call graph file.
 */
[[nodiscard]] graphmat::Result<graph::CallGraph> load_call_graph(const std::string& path,
                                                                 const std::string& schema_dir);

[[nodiscard]] nlohmann::json to_json(const graph::CallGraph& graph);

/**
 * Build a seed matching from a seed.v1 document (pairs kept in file order).
 */
[[nodiscard]] graphmat::Result<match::SeedMatching> seed_from_json(const nlohmann::json& j);

/**
 * Read and schema-validate a seed file.
 */
[[nodiscard]] graphmat::Result<match::SeedMatching> load_seed(const std::string& path,
                                                              const std::string& schema_dir);

/**
 * Seed made of the two entry points, when both graphs record one.
 * @return Single-pair seed, or InvalidSeed when an entry is missing
 */
[[nodiscard]] graphmat::Result<match::SeedMatching> entry_seed(const graph::CallGraph& graph_a,
                                                               const graph::CallGraph& graph_b);

}  // namespace graphmat::io
