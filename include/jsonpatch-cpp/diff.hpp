/// @file diff.hpp
/// @brief Generate a JSON Patch from two documents.

#pragma once

#include <nlohmann/json.hpp>

namespace jsonpatch_cpp {

/// Compute a patch document that turns @p source into @p target.
///
/// Equal values produce nothing. Two objects are compared key by key; two
/// arrays are compared element-wise through their longest common
/// subsequence and produce only add and remove operations. Any other
/// difference becomes a replace of the whole value.
///
/// Each call owns its own working state, so concurrent calls are safe.
auto diff(const nlohmann::json& source, const nlohmann::json& target) -> nlohmann::json;

}  // namespace jsonpatch_cpp
