/// @file operation.hpp
/// @brief Typed JSON Patch operations and their wire encoding.

#pragma once

#include <jsonpatch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace jsonpatch_cpp {

/// The six RFC 6902 operation kinds.
enum class OpKind : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpKind to the value of its "op" member.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
        case OpKind::move:    return "move";
        case OpKind::copy:    return "copy";
        case OpKind::test:    return "test";
    }
    return "unknown";
}

/// Look up an OpKind by its "op" member, or nullopt if unrecognized.
constexpr auto op_kind_from_string(std::string_view name) noexcept -> std::optional<OpKind> {
    if (name == "add")     return OpKind::add;
    if (name == "remove")  return OpKind::remove;
    if (name == "replace") return OpKind::replace;
    if (name == "move")    return OpKind::move;
    if (name == "copy")    return OpKind::copy;
    if (name == "test")    return OpKind::test;
    return std::nullopt;
}

/// Insert a value at path.
struct AddOp {
    Pointer path;
    nlohmann::json value;
    auto operator==(const AddOp&) const -> bool = default;
};

/// Delete the value at path.
struct RemoveOp {
    Pointer path;
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// Overwrite the existing value at path.
struct ReplaceOp {
    Pointer path;
    nlohmann::json value;
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// Remove the value at from and add it at path.
struct MoveOp {
    Pointer from;
    Pointer path;
    auto operator==(const MoveOp&) const -> bool = default;
};

/// Add a copy of the value at from at path.
struct CopyOp {
    Pointer from;
    Pointer path;
    auto operator==(const CopyOp&) const -> bool = default;
};

/// Require the value at path to deep-equal value.
struct TestOp {
    Pointer path;
    nlohmann::json value;
    auto operator==(const TestOp&) const -> bool = default;
};

/// One patch operation.
using Operation = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp,
    MoveOp,
    CopyOp,
    TestOp
>;

/// The kind of the operation held by @p op.
auto kind_of(const Operation& op) noexcept -> OpKind;

/// The target location of @p op.
auto path_of(const Operation& op) noexcept -> const Pointer&;

/// Decode one element of a patch document.
///
/// @throws PatchError malformed_patch if the element is not an object or
///   its op is not a recognized string; missing_member if op, path, from or
///   value is required and absent; invalid_pointer if a pointer is invalid.
auto parse_operation(const nlohmann::json& element) -> Operation;

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
