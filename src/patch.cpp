#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/log.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

namespace {

/// True if a move from @p from to @p path would place a value inside itself.
auto moves_into_itself(const Pointer& from, const Pointer& path, MoveCheck check) -> bool {
    if (check == MoveCheck::textual) {
        return path.to_string().starts_with(from.to_string());
    }
    return from.is_proper_prefix_of(path);
}

/// Apply one decoded operation to an owned document and return the result.
auto apply_operation(nlohmann::json doc, const Operation& op,
                     const ApplyOptions& options) -> nlohmann::json {
    return std::visit(overload{
        [&](const AddOp& o) {
            return o.path.add(std::move(doc), o.value);
        },
        [&](const RemoveOp& o) {
            return o.path.remove(std::move(doc));
        },
        [&](const ReplaceOp& o) {
            return o.path.replace(std::move(doc), o.value);
        },
        [&](const CopyOp& o) {
            auto value = o.from.get(doc);
            return o.path.add(std::move(doc), std::move(value));
        },
        [&](const MoveOp& o) {
            if (o.from == o.path) return std::move(doc);
            if (moves_into_itself(o.from, o.path, options.move_check)) {
                throw PatchError{ErrorKind::illegal_move,
                    "The 'from' path '" + o.from.to_string() + "' of the patch operation "
                    "'move' is a proper prefix of the 'path' path '" + o.path.to_string() + "'"};
            }
            auto value = o.from.get(doc);
            return o.path.add(o.from.remove(std::move(doc)), std::move(value));
        },
        [&](const TestOp& o) {
            if (o.path.get(doc) != o.value) {
                throw PatchError{ErrorKind::test_failed,
                    "The JSON patch operation 'test' failed at '" + o.path.to_string() + "'"};
            }
            return std::move(doc);
        },
    }, op);
}

[[noreturn]] void root_mismatch(std::string_view expected, const nlohmann::json& result) {
    throw PatchError{ErrorKind::root_type_mismatch,
        "The patched document is a " + std::string{result.type_name()} +
        ", expected " + std::string{expected}};
}

}  // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Patch::Patch() : operations_(nlohmann::json::array()) {}

Patch::Patch(nlohmann::json operations) : operations_(std::move(operations)) {
    if (!operations_.is_array()) {
        throw PatchError{ErrorKind::malformed_patch,
            "A JSON patch must be an array, got " + std::string{operations_.type_name()}};
    }
}

auto Patch::parse(std::string_view text) -> Patch {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw PatchError{ErrorKind::malformed_patch, "A JSON patch must be valid JSON text"};
    }
    return Patch{std::move(j)};
}

auto Patch::diff(const nlohmann::json& source,
                 const nlohmann::json& target) -> nlohmann::json {
    return jsonpatch_cpp::diff(source, target);
}

// =============================================================================
// Application
// =============================================================================

auto Patch::apply(const nlohmann::json& target,
                  const ApplyOptions& options) const -> nlohmann::json {
    auto result = target;
    auto index = std::size_t{0};
    try {
        for (const auto& element : operations_) {
            auto op = parse_operation(element);
            PLOGV_(log_instance) << "apply #" << index << ' '
                                 << to_string_view(kind_of(op)) << " '"
                                 << path_of(op).to_string() << "'";
            result = apply_operation(std::move(result), op, options);
            ++index;
        }
    } catch (const PatchError& e) {
        PLOGD_(log_instance) << "patch operation #" << index << " failed ("
                             << to_string_view(e.kind()) << "): " << e.what();
        throw;
    }
    return result;
}

auto Patch::apply(const nlohmann::json::object_t& target,
                  const ApplyOptions& options) const -> nlohmann::json::object_t {
    auto result = apply(nlohmann::json(target), options);
    if (!result.is_object()) root_mismatch("object", result);
    return std::move(result.get_ref<nlohmann::json::object_t&>());
}

auto Patch::apply(const nlohmann::json::array_t& target,
                  const ApplyOptions& options) const -> nlohmann::json::array_t {
    auto result = apply(nlohmann::json(target), options);
    if (!result.is_array()) root_mismatch("array", result);
    return std::move(result.get_ref<nlohmann::json::array_t&>());
}

// =============================================================================
// Inspection
// =============================================================================

auto Patch::operations() const -> std::vector<Operation> {
    auto result = std::vector<Operation>{};
    result.reserve(operations_.size());
    for (const auto& element : operations_) {
        result.push_back(parse_operation(element));
    }
    return result;
}

auto Patch::to_string() const -> std::string {
    return operations_.dump();
}

auto Patch::hash() const -> std::size_t {
    return std::hash<nlohmann::json>{}(operations_);
}

auto operator<<(std::ostream& os, const Patch& patch) -> std::ostream& {
    return os << patch.to_string();
}

void to_json(nlohmann::json& j, const Patch& patch) {
    j = patch.to_json();
}

void from_json(const nlohmann::json& j, Patch& patch) {
    patch = Patch{j};
}

}  // namespace jsonpatch_cpp
