/// @file builder.hpp
/// @brief Fluent construction of JSON Patch documents.

#pragma once

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace jsonpatch_cpp {

/// Accumulates operations into a patch document.
///
/// Pointer text is validated as each operation is appended, so a builder
/// never holds an operation with an unparsable path.
///
/// @code
/// auto result = PatchBuilder{}
///     .add("/John/phones/office", "1234-567")
///     .remove("/Amy/age")
///     .apply(contacts);
/// @endcode
class PatchBuilder {
public:
    PatchBuilder();

    /// Continue an existing operation list.
    /// @throws PatchError (malformed_patch) if @p operations is not an array.
    explicit PatchBuilder(nlohmann::json operations);

    auto add(std::string_view path, nlohmann::json value) -> PatchBuilder&;
    auto add(Pointer path, nlohmann::json value) -> PatchBuilder&;

    auto remove(std::string_view path) -> PatchBuilder&;
    auto remove(Pointer path) -> PatchBuilder&;

    auto replace(std::string_view path, nlohmann::json value) -> PatchBuilder&;
    auto replace(Pointer path, nlohmann::json value) -> PatchBuilder&;

    auto move(std::string_view path, std::string_view from) -> PatchBuilder&;
    auto move(Pointer path, Pointer from) -> PatchBuilder&;

    auto copy(std::string_view path, std::string_view from) -> PatchBuilder&;
    auto copy(Pointer path, Pointer from) -> PatchBuilder&;

    auto test(std::string_view path, nlohmann::json value) -> PatchBuilder&;
    auto test(Pointer path, nlohmann::json value) -> PatchBuilder&;

    /// Append an already typed operation.
    auto append(const Operation& op) -> PatchBuilder&;

    auto size() const noexcept -> std::size_t { return operations_.size(); }

    /// The accumulated patch document.
    auto build() const -> nlohmann::json { return operations_; }

    auto to_patch() const -> Patch { return Patch{operations_}; }

    /// Build and apply in one step. See Patch::apply.
    auto apply(const nlohmann::json& target,
               const ApplyOptions& options = {}) const -> nlohmann::json;
    auto apply(const nlohmann::json::object_t& target,
               const ApplyOptions& options = {}) const -> nlohmann::json::object_t;
    auto apply(const nlohmann::json::array_t& target,
               const ApplyOptions& options = {}) const -> nlohmann::json::array_t;

private:
    nlohmann::json operations_;
};

}  // namespace jsonpatch_cpp
