/// @file patch.hpp
/// @brief The JSON Patch (RFC 6902) application engine.

#pragma once

#include <jsonpatch-cpp/operation.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// How a move operation decides that from is an ancestor of path.
enum class MoveCheck : std::uint8_t {
    strict,   ///< from's reference tokens are a proper prefix of path's.
    textual,  ///< path's text starts with from's text ("/ab" blocks "/abc").
};

/// Settings for Patch::apply.
struct ApplyOptions {
    MoveCheck move_check{MoveCheck::strict};
};

/// An immutable JSON Patch.
///
/// A Patch wraps the operation list of a patch document. Operations are
/// decoded and validated as they are applied, in order; the first one that
/// cannot be satisfied aborts the whole application with a PatchError.
/// Applying never modifies the Patch or the caller's target, so a single
/// Patch may be applied concurrently from several threads.
///
/// @code
/// auto patch = Patch{nlohmann::json::parse(R"([
///     {"op": "replace", "path": "/name", "value": "Bob"},
///     {"op": "add", "path": "/tags/-", "value": "admin"}
/// ])")};
/// auto result = patch.apply(doc);
/// @endcode
class Patch {
public:
    /// Construct the empty patch.
    Patch();

    /// Wrap an operation list.
    /// @throws PatchError (malformed_patch) if @p operations is not an array.
    explicit Patch(nlohmann::json operations);

    /// Parse a patch document from JSON text.
    /// @throws PatchError (malformed_patch) if the text is not a JSON array.
    static auto parse(std::string_view text) -> Patch;

    /// Generate a patch document that turns @p source into @p target.
    /// The result need not be unique; applying it to @p source yields
    /// @p target.
    static auto diff(const nlohmann::json& source,
                     const nlohmann::json& target) -> nlohmann::json;

    // -- Application ----------------------------------------------------------

    /// Apply all operations in order to a copy of @p target.
    /// @throws PatchError describing the first operation that failed.
    auto apply(const nlohmann::json& target,
               const ApplyOptions& options = {}) const -> nlohmann::json;

    /// Apply to an object root; the result must also be an object.
    /// @throws PatchError (root_type_mismatch) if it is not.
    auto apply(const nlohmann::json::object_t& target,
               const ApplyOptions& options = {}) const -> nlohmann::json::object_t;

    /// Apply to an array root; the result must also be an array.
    /// @throws PatchError (root_type_mismatch) if it is not.
    auto apply(const nlohmann::json::array_t& target,
               const ApplyOptions& options = {}) const -> nlohmann::json::array_t;

    // -- Inspection -----------------------------------------------------------

    /// Decode every operation.
    /// @throws PatchError if any element is malformed.
    auto operations() const -> std::vector<Operation>;

    auto size() const noexcept -> std::size_t { return operations_.size(); }
    auto empty() const noexcept -> bool { return operations_.empty(); }

    /// The underlying patch document.
    auto to_json() const -> const nlohmann::json& { return operations_; }

    /// Compact JSON text of the patch document.
    auto to_string() const -> std::string;

    auto hash() const -> std::size_t;

    auto operator==(const Patch& other) const -> bool {
        return operations_ == other.operations_;
    }

private:
    nlohmann::json operations_;
};

auto operator<<(std::ostream& os, const Patch& patch) -> std::ostream&;

void to_json(nlohmann::json& j, const Patch& patch);
void from_json(const nlohmann::json& j, Patch& patch);

}  // namespace jsonpatch_cpp

template <>
struct std::hash<jsonpatch_cpp::Patch> {
    auto operator()(const jsonpatch_cpp::Patch& patch) const -> std::size_t {
        return patch.hash();
    }
};
