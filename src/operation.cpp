#include <jsonpatch-cpp/operation.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace jsonpatch_cpp {

namespace {

[[noreturn]] void missing_member(std::string_view op, std::string_view member) {
    throw PatchError{ErrorKind::missing_member,
        "The JSON Patch operation " + std::string{op} + " must contain a " +
        std::string{member} + " member"};
}

auto get_pointer(const nlohmann::json& element, std::string_view op,
                 const char* member) -> Pointer {
    auto it = element.find(member);
    if (it == element.end()) missing_member(op, member);
    if (!it->is_string()) {
        throw PatchError{ErrorKind::malformed_patch,
            "The " + std::string{member} + " member of the JSON Patch operation " +
            std::string{op} + " must be a string"};
    }
    return Pointer{it->get_ref<const std::string&>()};
}

auto get_value(const nlohmann::json& element, std::string_view op) -> nlohmann::json {
    auto it = element.find("value");
    if (it == element.end()) missing_member(op, "value");
    return *it;
}

}  // anonymous namespace

auto kind_of(const Operation& op) noexcept -> OpKind {
    return std::visit(overload{
        [](const AddOp&)     { return OpKind::add; },
        [](const RemoveOp&)  { return OpKind::remove; },
        [](const ReplaceOp&) { return OpKind::replace; },
        [](const MoveOp&)    { return OpKind::move; },
        [](const CopyOp&)    { return OpKind::copy; },
        [](const TestOp&)    { return OpKind::test; },
    }, op);
}

auto path_of(const Operation& op) noexcept -> const Pointer& {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

auto parse_operation(const nlohmann::json& element) -> Operation {
    if (!element.is_object()) {
        throw PatchError{ErrorKind::malformed_patch,
            "A JSON patch must be an array of JSON objects."};
    }
    auto op_it = element.find("op");
    if (op_it == element.end()) {
        throw PatchError{ErrorKind::missing_member,
            "A JSON Patch operation must contain an op member"};
    }
    if (!op_it->is_string()) {
        throw PatchError{ErrorKind::malformed_patch,
            "The op member of a JSON Patch operation must be a string, got " + op_it->dump()};
    }
    const auto& name = op_it->get_ref<const std::string&>();
    auto kind = op_kind_from_string(name);
    if (!kind) {
        throw PatchError{ErrorKind::malformed_patch,
            "Illegal value for the op member of the JSON patch operation: " + name};
    }

    auto path = get_pointer(element, name, "path");
    switch (*kind) {
        case OpKind::add:
            return AddOp{std::move(path), get_value(element, name)};
        case OpKind::remove:
            return RemoveOp{std::move(path)};
        case OpKind::replace:
            return ReplaceOp{std::move(path), get_value(element, name)};
        case OpKind::move:
            return MoveOp{get_pointer(element, name, "from"), std::move(path)};
        case OpKind::copy:
            return CopyOp{get_pointer(element, name, "from"), std::move(path)};
        case OpKind::test:
            return TestOp{std::move(path), get_value(element, name)};
    }
    throw PatchError{ErrorKind::malformed_patch, "Unhandled JSON Patch operation: " + name};
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"op", std::string{to_string_view(kind_of(op))}},
        {"path", path_of(op).to_string()},
    };
    std::visit(overload{
        [&](const AddOp& o)     { j["value"] = o.value; },
        [](const RemoveOp&)     {},
        [&](const ReplaceOp& o) { j["value"] = o.value; },
        [&](const MoveOp& o)    { j["from"] = o.from.to_string(); },
        [&](const CopyOp& o)    { j["from"] = o.from.to_string(); },
        [&](const TestOp& o)    { j["value"] = o.value; },
    }, op);
}

void from_json(const nlohmann::json& j, Operation& op) {
    op = parse_operation(j);
}

}  // namespace jsonpatch_cpp
