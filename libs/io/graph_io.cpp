/**
 * @file graph_io.cpp
 * @brief JSON loading of call graphs and seed matchings
 */

#include "graphmat/graph_io.hpp"

#include "graphmat/json_io.hpp"
#include "graphmat/version.hpp"

#include <format>
#include <ranges>
#include <utility>
#include <vector>

namespace graphmat::io {

namespace {

[[nodiscard]] graphmat::Error invalid_graph(std::string message)
{
    return Error::make("InvalidGraph", std::move(message));
}

[[nodiscard]] graphmat::Result<VertexId> read_address(const nlohmann::json& j,
                                                      std::string_view key,
                                                      std::string_view where)
{
    const std::string name(key);
    if (!j.contains(name) || !j.at(name).is_number_unsigned()) {
        return std::unexpected(
            invalid_graph(std::format("{}: '{}' must be a non-negative integer", where, key)));
    }
    return j.at(name).get<VertexId>();
}

}  // namespace

graphmat::Result<graph::CallGraph> call_graph_from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("functions") || !j.at("functions").is_array()) {
        return std::unexpected(invalid_graph("Call graph document needs a 'functions' array"));
    }

    graph::CallGraphBuilder builder;
    if (j.contains("base_address")) {
        auto base = read_address(j, "base_address", "call graph");
        if (!base) {
            return std::unexpected(base.error());
        }
        builder.set_base_address(*base);
    }
    if (j.contains("entry")) {
        auto entry = read_address(j, "entry", "call graph");
        if (!entry) {
            return std::unexpected(entry.error());
        }
        builder.set_entry(*entry);
    }

    for (auto [index, function] : std::views::enumerate(j.at("functions"))) {
        const auto where = std::format("functions[{}]", index);
        auto address = read_address(function, "address", where);
        if (!address) {
            return std::unexpected(address.error());
        }

        std::vector<std::string> opcodes;
        if (function.contains("opcodes")) {
            for (const auto& opcode : function.at("opcodes")) {
                if (!opcode.is_string()) {
                    return std::unexpected(
                        invalid_graph(std::format("{}: opcodes must be strings", where)));
                }
                opcodes.push_back(opcode.get<std::string>());
            }
        }
        builder.add_function(*address, std::move(opcodes));

        if (function.contains("calls")) {
            for (const auto& callee : function.at("calls")) {
                if (!callee.is_number_unsigned()) {
                    return std::unexpected(
                        invalid_graph(std::format("{}: calls must be addresses", where)));
                }
                builder.add_call(*address, callee.get<VertexId>());
            }
        }
    }

    return std::move(builder).build();
}

graphmat::Result<graph::CallGraph> load_call_graph(const std::string& path,
                                                   const std::string& schema_dir)
{
    auto document = common::read_versioned_document(path, kCallGraphSchemaVersion, schema_dir);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto graph = call_graph_from_json(*document);
    if (!graph) {
        return std::unexpected(Error::make(graph.error().code, path + ": " + graph.error().message));
    }
    return graph;
}

nlohmann::json to_json(const graph::CallGraph& graph)
{
    nlohmann::json functions = nlohmann::json::array();
    for (const auto& vertex : graph.vertices()) {
        functions.push_back({
            {"address",          vertex.id()},
            {"opcodes",     vertex.opcodes()},
            {  "calls", vertex.call_sites()}
        });
    }

    nlohmann::json j = {
        {"schema_version", kCallGraphSchemaVersion},
        {  "base_address",   graph.base_address()},
        {     "functions",               functions}
    };
    if (auto entry = graph.entry()) {
        j["entry"] = *entry;
    }
    return j;
}

graphmat::Result<match::SeedMatching> seed_from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("pairs") || !j.at("pairs").is_array()) {
        return std::unexpected(
            Error::make("InvalidSeed", "Seed document needs a 'pairs' array"));
    }

    match::SeedMatching seed;
    for (auto [index, pair] : std::views::enumerate(j.at("pairs"))) {
        const auto where = std::format("pairs[{}]", index);
        auto a = read_address(pair, "a", where);
        auto b = read_address(pair, "b", where);
        if (!a || !b) {
            return std::unexpected(Error::make(
                "InvalidSeed", std::format("{}: 'a' and 'b' must be addresses", where)));
        }
        seed.pairs.emplace_back(*a, *b);
    }
    return seed;
}

graphmat::Result<match::SeedMatching> load_seed(const std::string& path,
                                                const std::string& schema_dir)
{
    auto document = common::read_versioned_document(path, kSeedSchemaVersion, schema_dir);
    if (!document) {
        return std::unexpected(document.error());
    }
    return seed_from_json(*document);
}

graphmat::Result<match::SeedMatching> entry_seed(const graph::CallGraph& graph_a,
                                                 const graph::CallGraph& graph_b)
{
    auto entry_a = graph_a.entry();
    auto entry_b = graph_b.entry();
    if (!entry_a || !entry_b) {
        return std::unexpected(Error::make(
            "InvalidSeed", "No seed given and at least one call graph has no entry point"));
    }
    return match::SeedMatching{.pairs = {{*entry_a, *entry_b}}};
}

}  // namespace graphmat::io
