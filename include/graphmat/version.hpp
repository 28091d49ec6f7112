#pragma once

/**
 * @file version.hpp
 * @brief graphmat version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace graphmat {

/// graphmat version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document format versions (embedded in all inputs and outputs)
constexpr const char* kCallGraphSchemaVersion = "call_graph.v1";
constexpr const char* kSeedSchemaVersion = "seed.v1";
constexpr const char* kMatcherConfigSchemaVersion = "matcher_config.v1";
constexpr const char* kEditSequenceSchemaVersion = "edit_sequence.v1";

}  // namespace graphmat
