/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "graphmat/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string_view>
#include <vector>

namespace graphmat::canonical {

namespace {

graphmat::VoidResult reject_floats(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = reject_floats(val, path + "." + key); !result) {
                return result;
            }
        }
        return {};
    }
    if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = reject_floats(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

// nlohmann::json objects are std::map backed, so dumping already sorts keys.
// The explicit pass keeps the ordering independent of the object_t in use.
void append_canonical(const nlohmann::json& j, std::string& out)
{
    if (j.is_object()) {
        std::vector<std::string_view> keys;
        keys.reserve(j.size());
        for (const auto& item : j.items()) {
            keys.emplace_back(item.key());
        }
        std::ranges::sort(keys);

        out.push_back('{');
        for (auto [i, key] : std::views::enumerate(keys)) {
            if (i > 0) {
                out.push_back(',');
            }
            out += nlohmann::json(std::string(key)).dump();
            out.push_back(':');
            append_canonical(j.at(std::string(key)), out);
        }
        out.push_back('}');
        return;
    }
    if (j.is_array()) {
        out.push_back('[');
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (i > 0) {
                out.push_back(',');
            }
            append_canonical(elem, out);
        }
        out.push_back(']');
        return;
    }
    out += j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

}  // namespace

graphmat::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = reject_floats(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    std::string out;
    try {
        append_canonical(j, out);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("ParseError",
                                           std::string("Failed to serialize JSON: ") + ex.what()));
    }
    return out;
}

graphmat::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return reject_floats(j, "$");
}

}  // namespace graphmat::canonical
