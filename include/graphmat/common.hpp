#pragma once

/**
 * @file common.hpp
 * @brief Common types: Error, Result, vertex identifiers
 */

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace graphmat {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Function entry address, relative to the text section base.
using VertexId = std::uint64_t;

/// A pair of vertices, one from each graph (A first).
using VertexPair = std::pair<VertexId, VertexId>;

}  // namespace graphmat
